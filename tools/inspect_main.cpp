#include "inspect.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[])
{
    std::vector<std::string> args(argv + 1, argv + argc);
    return mediate::tools::run_inspect(args, std::cout, std::cerr);
}
