#include "../../audit/audit_logger.hpp"
#include "../../crypto/ticket_protection.hpp"
#include "../../policy/config.hpp"
#include "../../service/ticket_service.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

void print_usage(const char *argv0) {
    std::cerr << "usage: " << argv0 << "\n"
              << "Reads one JSON request per line from stdin and writes one JSON\n"
              << "response per line to stdout.\n\n"
              << "  {\"kind\":\"GENERATE\",\"name\":\"alice\",\"custom_data\":\"{}\"}\n"
              << "  {\"kind\":\"VALIDATE\",\"ticket\":\"<hex>\"}\n\n"
              << "Keys and policy come from FORMSAUTH_* environment variables;\n"
              << "FORMSAUTH_AUDIT_LOG names an optional JSON-lines audit log.\n";
}

} // namespace

int main(int argc, char **argv) {
    using namespace formsauth;

    if (argc > 1) {
        const std::string arg = argv[1];
        print_usage(argv[0]);
        return (arg == "-h" || arg == "--help") ? 0 : 2;
    }

    std::shared_ptr<const AuditLogger> audit;
    if (const char *log_path = std::getenv("FORMSAUTH_AUDIT_LOG")) {
        audit = std::make_shared<AuditLogger>(log_path);
    }

    std::unique_ptr<TicketCodec> codec;
    try {
        codec = std::make_unique<TicketCodec>(
            resolve_config(load_options_from_environment()), audit);
    } catch (const std::exception &ex) {
        std::cerr << "ticketctl: invalid configuration: " << ex.what() << std::endl;
        return 1;
    }

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) continue;
        std::cout << handle_request_line(*codec, line) << '\n';
        std::cout.flush();
    }

    return 0;
}
