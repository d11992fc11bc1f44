// Integration tests for the FTP and FTPS clients against a real server.
// Skipped (exit code 77) unless PORTKEYDROP_IT_FTP_HOST is set; FTPS runs
// only when PORTKEYDROP_IT_FTP_TLS=1.
#include "ClientRoundTrip.hpp"
#include "portkeydrop/ClientFactory.hpp"

using namespace pkdtest;

int main() {
    const auto host = envValue("PORTKEYDROP_IT_FTP_HOST");
    if (!host) {
        std::cout << "[SKIP] portkeydrop_ftp_integration_tests requires "
                     "PORTKEYDROP_IT_FTP_HOST (plus _USER, _PASS, _PORT)\n";
        return kSkipExitCode;
    }

    portkeydrop::ConnectionInfo info;
    info.protocol = envValue("PORTKEYDROP_IT_FTP_TLS").value_or("0") == "1"
                        ? portkeydrop::Protocol::Ftps
                        : portkeydrop::Protocol::Ftp;
    if (!parsePort(envValue("PORTKEYDROP_IT_FTP_PORT"), info.port)) {
        std::cerr << "[FAIL] PORTKEYDROP_IT_FTP_PORT is invalid\n";
        return EXIT_FAILURE;
    }
    info.host = *host;
    info.username = envValue("PORTKEYDROP_IT_FTP_USER").value_or("anonymous");
    info.password = envValue("PORTKEYDROP_IT_FTP_PASS").value_or("");
    const std::string remoteBase =
        envValue("PORTKEYDROP_IT_FTP_REMOTE_BASE").value_or("/");

    portkeydrop::OpError err;
    auto client = portkeydrop::createClient(info, err);
    if (!client) {
        std::cerr << "[FAIL] createClient: " << err.message << "\n";
        return EXIT_FAILURE;
    }

    TestContext t;
    runRoundTrip(*client, remoteBase, t);

    info.password = "definitely-wrong-password";
    auto rejected = portkeydrop::createClient(info, err);
    if (rejected && info.username != "anonymous") {
        err.clear();
        t.check(!rejected->connect(err) &&
                    err.code == portkeydrop::ErrorCode::ConnectionFailed,
                "bad password is a ConnectionFailed");
    }

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] portkeydrop_ftp_integration_tests\n";
    return EXIT_SUCCESS;
}
