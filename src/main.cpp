#include "scrubby/cli.hpp"

int main(int argc, char *argv[])
{
    return scrubby::cli::run(argc, argv);
}
