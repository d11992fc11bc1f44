// System secret store: Keychain (macOS) or libsecret (Linux). Without a
// platform backend every call reports Unavailable.
#include "SecretStore.hpp"
#include <QByteArray>
#include <QLoggingCategory>
Q_LOGGING_CATEGORY(pkdSecrets, "portkeydrop.secrets")

const char *persistStatusName(SecretStore::PersistStatus st) {
    switch (st) {
    case SecretStore::PersistStatus::Stored:
        return "stored";
    case SecretStore::PersistStatus::Unavailable:
        return "unavailable";
    case SecretStore::PersistStatus::PermissionDenied:
        return "permission_denied";
    case SecretStore::PersistStatus::BackendError:
        return "backend_error";
    }
    return "unknown";
}

SystemSecretStore::SystemSecretStore(QString service)
    : service_(std::move(service)) {}

#ifdef __APPLE__
#include <CoreFoundation/CoreFoundation.h>
#include <Security/Security.h>

static CFStringRef cfString(const QString &s) {
    return CFStringCreateWithCharacters(
        kCFAllocatorDefault, reinterpret_cast<const UniChar *>(s.utf16()),
        s.size());
}

static CFMutableDictionaryRef baseQuery(CFStringRef service,
                                        CFStringRef account) {
    CFMutableDictionaryRef query = CFDictionaryCreateMutable(
        kCFAllocatorDefault, 0, &kCFTypeDictionaryKeyCallBacks,
        &kCFTypeDictionaryValueCallBacks);
    CFDictionarySetValue(query, kSecClass, kSecClassGenericPassword);
    CFDictionarySetValue(query, kSecAttrService, service);
    CFDictionarySetValue(query, kSecAttrAccount, account);
    return query;
}

static SecretStore::PersistResult mapOsStatus(OSStatus st) {
    SecretStore::PersistResult r;
    if (st == errSecSuccess)
        return r;
    if (st == errSecNotAvailable) {
        r.status = SecretStore::PersistStatus::Unavailable;
    } else if (st == errSecAuthFailed || st == errSecInteractionNotAllowed ||
               st == errSecUserCanceled) {
        r.status = SecretStore::PersistStatus::PermissionDenied;
    } else {
        r.status = SecretStore::PersistStatus::BackendError;
    }
    r.detail = QString("Keychain OSStatus=%1").arg((int)st);
    return r;
}

SecretStore::PersistResult SystemSecretStore::setSecret(const QString &key,
                                                        const QString &value) {
    if (key.isEmpty())
        return {PersistStatus::BackendError, QStringLiteral("Empty secret key")};
    CFStringRef service = cfString(service_);
    CFStringRef account = cfString(key);
    const QByteArray bytes = value.toUtf8();
    CFDataRef data =
        CFDataCreate(kCFAllocatorDefault,
                     reinterpret_cast<const UInt8 *>(bytes.constData()),
                     bytes.size());
    if (!service || !account || !data) {
        if (data)
            CFRelease(data);
        if (account)
            CFRelease(account);
        if (service)
            CFRelease(service);
        return {PersistStatus::BackendError,
                QStringLiteral("Could not build Keychain item")};
    }

    CFMutableDictionaryRef query = baseQuery(service, account);
    CFMutableDictionaryRef attrs = CFDictionaryCreateMutable(
        kCFAllocatorDefault, 0, &kCFTypeDictionaryKeyCallBacks,
        &kCFTypeDictionaryValueCallBacks);
    CFDictionarySetValue(attrs, kSecValueData, data);
    CFDictionarySetValue(attrs, kSecAttrAccessible,
                         kSecAttrAccessibleAfterFirstUnlock);
    OSStatus st = SecItemUpdate(query, attrs);
    if (st == errSecItemNotFound) {
        CFDictionarySetValue(query, kSecValueData, data);
        CFDictionarySetValue(query, kSecAttrAccessible,
                             kSecAttrAccessibleAfterFirstUnlock);
        st = SecItemAdd(query, nullptr);
    }

    CFRelease(attrs);
    CFRelease(query);
    CFRelease(data);
    CFRelease(account);
    CFRelease(service);
    return mapOsStatus(st);
}

std::optional<QString> SystemSecretStore::getSecret(const QString &key) const {
    CFStringRef service = cfString(service_);
    CFStringRef account = cfString(key);
    CFMutableDictionaryRef query = baseQuery(service, account);
    CFDictionarySetValue(query, kSecReturnData, kCFBooleanTrue);
    CFDictionarySetValue(query, kSecMatchLimit, kSecMatchLimitOne);

    CFTypeRef result = nullptr;
    OSStatus st = SecItemCopyMatching(query, &result);
    CFRelease(query);
    CFRelease(account);
    CFRelease(service);
    if (st != errSecSuccess || !result) {
        if (st != errSecItemNotFound && st != errSecSuccess)
            qCWarning(pkdSecrets) << "Keychain lookup failed, OSStatus" << (int)st;
        return std::nullopt;
    }

    QString out;
    if (CFGetTypeID(result) == CFDataGetTypeID()) {
        CFDataRef data = (CFDataRef)result;
        out = QString::fromUtf8(
            reinterpret_cast<const char *>(CFDataGetBytePtr(data)),
            (int)CFDataGetLength(data));
    }
    CFRelease(result);
    return out.isEmpty() ? std::nullopt : std::optional<QString>(out);
}

SecretStore::PersistResult
SystemSecretStore::removeSecret(const QString &key) {
    CFStringRef service = cfString(service_);
    CFStringRef account = cfString(key);
    CFMutableDictionaryRef query = baseQuery(service, account);
    OSStatus st = SecItemDelete(query);
    CFRelease(query);
    CFRelease(account);
    CFRelease(service);
    if (st == errSecItemNotFound)
        return {};
    return mapOsStatus(st);
}

QString SystemSecretStore::backendName() const {
    return QStringLiteral("macOS Keychain");
}

bool SystemSecretStore::isAvailable() { return true; }

#elif defined(HAVE_LIBSECRET)

#include <libsecret/secret.h>

static const SecretSchema *portkeydropSchema() {
    static const SecretSchema schema = {
        "org.portkeydrop.Password",
        SECRET_SCHEMA_NONE,
        {{"service", SECRET_SCHEMA_ATTRIBUTE_STRING},
         {"site_id", SECRET_SCHEMA_ATTRIBUTE_STRING},
         {NULL, SECRET_SCHEMA_ATTRIBUTE_STRING}}};
    return &schema;
}

static SecretStore::PersistResult fromGError(GError *gerr,
                                             const char *fallback) {
    SecretStore::PersistResult r;
    r.status = SecretStore::PersistStatus::BackendError;
    r.detail = gerr ? QString::fromUtf8(gerr->message)
                    : QString::fromLatin1(fallback);
    if (gerr) {
        if (gerr->domain == G_DBUS_ERROR ||
            g_error_matches(gerr, G_IO_ERROR, G_IO_ERROR_NOT_FOUND))
            r.status = SecretStore::PersistStatus::Unavailable;
        else if (g_error_matches(gerr, G_IO_ERROR,
                                 G_IO_ERROR_PERMISSION_DENIED))
            r.status = SecretStore::PersistStatus::PermissionDenied;
        g_error_free(gerr);
    }
    return r;
}

SecretStore::PersistResult SystemSecretStore::setSecret(const QString &key,
                                                        const QString &value) {
    if (key.isEmpty())
        return {PersistStatus::BackendError, QStringLiteral("Empty secret key")};
    const QByteArray svc = service_.toUtf8();
    const QByteArray k = key.toUtf8();
    const QByteArray v = value.toUtf8();
    const QByteArray label = QString("PortkeyDrop password (%1)").arg(key).toUtf8();
    GError *gerr = nullptr;
    const gboolean ok = secret_password_store_sync(
        portkeydropSchema(), SECRET_COLLECTION_DEFAULT, label.constData(),
        v.constData(), nullptr, &gerr, "service", svc.constData(), "site_id",
        k.constData(), NULL);
    if (ok)
        return {};
    return fromGError(gerr, "libsecret store failed");
}

std::optional<QString> SystemSecretStore::getSecret(const QString &key) const {
    const QByteArray svc = service_.toUtf8();
    const QByteArray k = key.toUtf8();
    GError *gerr = nullptr;
    gchar *pw = secret_password_lookup_sync(portkeydropSchema(), nullptr,
                                            &gerr, "service", svc.constData(),
                                            "site_id", k.constData(), NULL);
    if (gerr) {
        qCWarning(pkdSecrets) << "Secret Service lookup failed:"
                              << QString::fromUtf8(gerr->message);
        g_error_free(gerr);
    }
    if (!pw)
        return std::nullopt;
    QString out = QString::fromUtf8(pw);
    secret_password_free(pw);
    return out.isEmpty() ? std::nullopt : std::optional<QString>(out);
}

SecretStore::PersistResult
SystemSecretStore::removeSecret(const QString &key) {
    const QByteArray svc = service_.toUtf8();
    const QByteArray k = key.toUtf8();
    GError *gerr = nullptr;
    secret_password_clear_sync(portkeydropSchema(), nullptr, &gerr, "service",
                               svc.constData(), "site_id", k.constData(),
                               NULL);
    if (gerr)
        return fromGError(gerr, "libsecret clear failed");
    return {};
}

QString SystemSecretStore::backendName() const {
    return QStringLiteral("Secret Service");
}

bool SystemSecretStore::isAvailable() {
    GError *gerr = nullptr;
    SecretService *svc = secret_service_get_sync(SECRET_SERVICE_NONE, nullptr,
                                                 &gerr);
    if (!svc) {
        qCInfo(pkdSecrets) << "Secret Service not reachable:"
                           << (gerr ? QString::fromUtf8(gerr->message)
                                    : QStringLiteral("unknown error"));
        if (gerr)
            g_error_free(gerr);
        return false;
    }
    g_object_unref(svc);
    return true;
}

#else

SecretStore::PersistResult SystemSecretStore::setSecret(const QString &key,
                                                        const QString &value) {
    Q_UNUSED(key);
    Q_UNUSED(value);
    return {PersistStatus::Unavailable,
            QStringLiteral("No system secret store in this build")};
}

std::optional<QString> SystemSecretStore::getSecret(const QString &key) const {
    Q_UNUSED(key);
    return std::nullopt;
}

SecretStore::PersistResult
SystemSecretStore::removeSecret(const QString &key) {
    Q_UNUSED(key);
    return {PersistStatus::Unavailable,
            QStringLiteral("No system secret store in this build")};
}

QString SystemSecretStore::backendName() const {
    return QStringLiteral("none");
}

bool SystemSecretStore::isAvailable() { return false; }

#endif
