// Integration tests for Libssh2SftpClient against a real SFTP server.
// Skipped (exit code 77) unless the PORTKEYDROP_IT_SFTP_* env vars exist.
#include "ClientRoundTrip.hpp"
#include "portkeydrop/Libssh2SftpClient.hpp"

#include <filesystem>

using namespace pkdtest;

int main() {
    const auto host = envValue("PORTKEYDROP_IT_SFTP_HOST");
    const auto user = envValue("PORTKEYDROP_IT_SFTP_USER");
    const auto pass = envValue("PORTKEYDROP_IT_SFTP_PASS");
    const auto keyPath = envValue("PORTKEYDROP_IT_SFTP_KEY");
    const std::string remoteBase =
        envValue("PORTKEYDROP_IT_REMOTE_BASE").value_or("/tmp");

    if (!host || !user || (!pass && !keyPath)) {
        std::cout << "[SKIP] portkeydrop_sftp_integration_tests requires "
                     "PORTKEYDROP_IT_SFTP_HOST, PORTKEYDROP_IT_SFTP_USER and "
                     "PORTKEYDROP_IT_SFTP_PASS or PORTKEYDROP_IT_SFTP_KEY\n";
        return kSkipExitCode;
    }
    std::error_code ec;
    if (keyPath && !std::filesystem::exists(*keyPath, ec)) {
        std::cerr << "[FAIL] PORTKEYDROP_IT_SFTP_KEY does not exist: "
                  << *keyPath << "\n";
        return EXIT_FAILURE;
    }

    portkeydrop::ConnectionInfo info;
    info.protocol = portkeydrop::Protocol::Sftp;
    if (!parsePort(envValue("PORTKEYDROP_IT_SFTP_PORT"), info.port)) {
        std::cerr << "[FAIL] PORTKEYDROP_IT_SFTP_PORT is invalid\n";
        return EXIT_FAILURE;
    }
    info.host = *host;
    info.username = *user;
    info.password = pass.value_or("");
    info.keyPath = keyPath.value_or("");
    info.hostKeyPolicy = portkeydrop::HostKeyPolicy::AutoAdd;
    // Keep the developer's known_hosts untouched.
    info.knownHostsPath = (std::filesystem::temp_directory_path(ec) /
                           ("portkeydrop-it-known_hosts-" + uniqueToken()))
                              .string();

    TestContext t;
    portkeydrop::Libssh2SftpClient client(info);
    runRoundTrip(client, remoteBase, t);

    // A second STRICT connection now finds the key remembered by AUTO_ADD.
    info.hostKeyPolicy = portkeydrop::HostKeyPolicy::Strict;
    portkeydrop::Libssh2SftpClient strict(info);
    portkeydrop::OpError err;
    t.check(strict.connect(err),
            "STRICT accepts the host remembered by AUTO_ADD: " + err.message);
    strict.disconnect();
    std::filesystem::remove(*info.knownHostsPath, ec);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] portkeydrop_sftp_integration_tests\n";
    return EXIT_SUCCESS;
}
