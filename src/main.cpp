#include "cli/cli.hpp"

int main(int argc, char* argv[]) {
    CLI cli(argc, argv);
    return cli.run();
}
