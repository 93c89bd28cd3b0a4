#include "options.hpp"
#include "session.hpp"

#include <exception>
#include <iostream>
#include <string>

int main(int argc, char **argv) {
    tbinfo::Options options;

    // Parse command-line options: --option key=value or -o key=value
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto set_kv = [&](const std::string &kv) {
            auto pos = kv.find('=');
            if (pos == std::string::npos) {
                options.set(kv, "");
            } else {
                options.set(kv.substr(0, pos), kv.substr(pos + 1));
            }
        };
        if (arg == "--option" || arg == "-o") {
            if (i + 1 < argc) {
                set_kv(argv[++i]);
            }
        } else if (arg.rfind("--option=", 0) == 0) {
            set_kv(arg.substr(std::string("--option=").size()));
        } else if (arg.rfind("-o=", 0) == 0) {
            set_kv(arg.substr(3));
        }
    }

    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    try {
        tbinfo::Session session(options, std::cout);
        session.run(std::cin);
    } catch (const std::exception &ex) {
        std::cerr << "Error: " << ex.what() << '\n';
        return 2;
    }

    return 0;
}
