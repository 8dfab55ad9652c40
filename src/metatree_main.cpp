#include <metatree/cli_exit_codes.h>
#include <metatree/errors.h>
#include <metatree/metatree_cli.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

int main(int argc, char **argv) {
  try {
    const std::vector<std::string> arguments(argv + 1, argv + argc);

    if (arguments.empty() || arguments.front() == "--help" ||
        arguments.front() == "-h") {
      metatree::PrintGlobalUsage(std::cout);
      return arguments.empty() ? metatree::kExitStartFailure
                               : metatree::kExitSuccess;
    }

    const std::vector<std::string> command_arguments(arguments.begin() + 1,
                                                     arguments.end());
    return metatree::RunCommand(arguments.front(), command_arguments);
  } catch (const metatree::ConsistencyError &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return metatree::kExitRunFailed;
  } catch (const metatree::ExternalFailure &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return metatree::kExitRunFailed;
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    metatree::PrintGlobalUsage(std::cerr);
    return metatree::kExitStartFailure;
  }
}
