#include "core/Common.hpp"
#include "core/Config.hpp"
#include "app.hpp"

int main(int argc, char** argv) {

    if (argc <= 1)
        return runInteractive();

    AppConfig config;
    std::string err;
    if (!ParseArgs(argc, argv, config, err)) {
        std::cerr << err << "\n" << UsageText(argv[0]);
        return 2;
    }

    if (config.help) {
        std::cout << UsageText(argv[0]);
        return 0;
    }

    return runApp(config);
}
