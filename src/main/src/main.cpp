#include <cstdlib>
#include <exception>
#include <iostream>

#include "fxt_invalid_argument_exception.hpp"
#include "fxtrack-command.hpp"
#include "processcommandsfromcli.hpp"
#include "runmodes.hpp"

int main(int argc, const char* argv[]) {
  using namespace fxt;
  try {
    const auto optCommand = ParseFxTrackCommand(argc, argv);

    if (optCommand && !ProcessCommandFromCLI(*optCommand, settings::RunMode::kProd)) {
      return EXIT_FAILURE;
    }
  } catch (const invalid_argument& e) {
    std::cerr << "Invalid argument: " << e.what() << '\n';
    return EXIT_FAILURE;
  } catch (const std::exception& e) {
    std::cerr << e.what() << '\n';
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
