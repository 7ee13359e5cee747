#include "cli/application.hpp"

int main(int argc, char** argv)
{
    return auraseal::cli::run(argc, argv);
}
