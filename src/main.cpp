#include <iostream>
#include <vector>
#include <string>
#include "cli/dispatcher.hpp"
#include "cli/theme.hpp"

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);

        SystemResolver resolver;
        SystemLauncher launcher;
        Dispatcher dispatcher(ConfigStore(ConfigStore::default_path()), resolver, launcher);

        return dispatcher.dispatch(args);
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string(e.what()));
        return 1;
    }
}
