#include "rrsync/cli/app.hpp"

auto main(int argc, char** argv) -> int {
    rrsync::cli::App app;
    return app.run(argc, argv);
}
