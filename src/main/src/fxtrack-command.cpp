#include "fxtrack-command.hpp"

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <optional>
#include <span>
#include <string_view>
#include <system_error>

#include "fxt_format.hpp"
#include "fxt_invalid_argument_exception.hpp"

namespace fxt {

namespace {

template <class T>
T ParseNumber(std::string_view str, std::string_view what) {
  T value{};
  const auto [ptr, errc] = std::from_chars(str.data(), str.data() + str.size(), value);
  if (errc != std::errc() || ptr != str.data() + str.size()) {
    throw invalid_argument("Invalid {} '{}'", what, str);
  }
  return value;
}

int32_t ParseStrictlyPositive(std::string_view str, std::string_view what) {
  const auto value = ParseNumber<int32_t>(str, what);
  if (value <= 0) {
    throw invalid_argument("{} should be strictly positive", what);
  }
  return value;
}

FxTrackCommandType ParseCommandType(std::string_view commandStr) {
  if (commandStr == "convert") {
    return FxTrackCommandType::kConvert;
  }
  if (commandStr == "save-rates") {
    return FxTrackCommandType::kSaveRates;
  }
  if (commandStr == "refresh") {
    return FxTrackCommandType::kRefresh;
  }
  if (commandStr == "ensure-fresh") {
    return FxTrackCommandType::kEnsureFresh;
  }
  if (commandStr == "migrate") {
    return FxTrackCommandType::kMigrate;
  }
  if (commandStr == "rollback") {
    return FxTrackCommandType::kRollback;
  }
  if (commandStr == "status") {
    return FxTrackCommandType::kStatus;
  }
  if (commandStr == "metrics") {
    return FxTrackCommandType::kMetrics;
  }
  throw invalid_argument("Unknown command '{}'", commandStr);
}

}  // namespace

string FxTrackUsage(std::string_view programName) {
  return format(
      "Usage: {} [--data <dir>] <command>\n"
      "Commands:\n"
      "  convert <amount> <from> <to> [<expenseId>]  Convert an amount, with the historical rate of the expense if any\n"
      "  save-rates <expenseId>                      Record the current rate of an expense\n"
      "  refresh                                     Refresh current rates from the base currency\n"
      "  ensure-fresh                                Refresh current rates if not done today\n"
      "  migrate [--batch-size=N] [--max-retries=N] [--resume]\n"
      "                                              Backfill historical rates of existing expenses\n"
      "  rollback                                    Delete all historical rates\n"
      "  status                                      Print the state of the last migration\n"
      "  metrics                                     Print cache metrics\n",
      programName);
}

std::optional<FxTrackCommand> ParseFxTrackCommand(std::span<const char *const> args) {
  static constexpr std::string_view kDataOpt = "--data";
  static constexpr std::string_view kBatchSizeOpt = "--batch-size=";
  static constexpr std::string_view kMaxRetriesOpt = "--max-retries=";

  FxTrackCommand command;
  std::optional<FxTrackCommandType> optCommandType;
  int nbPositionalArgs = 0;

  for (auto it = args.begin(); it != args.end(); ++it) {
    const std::string_view arg(*it);
    if (arg == "-h" || arg == "--help") {
      std::cout << FxTrackUsage("fxtrack");
      return std::nullopt;
    }
    if (arg == kDataOpt) {
      if (++it == args.end()) {
        throw invalid_argument("Expected a directory after {}", kDataOpt);
      }
      command.dataDir = *it;
    } else if (arg.starts_with(kBatchSizeOpt)) {
      command.batchSize = ParseStrictlyPositive(arg.substr(kBatchSizeOpt.size()), "batch size");
    } else if (arg.starts_with(kMaxRetriesOpt)) {
      command.nbMaxRetries = ParseStrictlyPositive(arg.substr(kMaxRetriesOpt.size()), "max retries");
    } else if (arg == "--resume") {
      command.resume = true;
    } else if (arg.starts_with("-")) {
      throw invalid_argument("Unknown option '{}'", arg);
    } else if (!optCommandType) {
      optCommandType = ParseCommandType(arg);
    } else {
      switch (*optCommandType) {
        case FxTrackCommandType::kConvert:
          switch (nbPositionalArgs) {
            case 0:
              command.amount = ParseNumber<double>(arg, "amount");
              break;
            case 1:
              command.from = CurrencyCode(arg);
              break;
            case 2:
              command.to = CurrencyCode(arg);
              break;
            case 3:
              command.expenseId = ParseNumber<ExpenseId>(arg, "expense id");
              break;
            default:
              throw invalid_argument("Too many arguments for convert");
          }
          break;
        case FxTrackCommandType::kSaveRates:
          if (nbPositionalArgs != 0) {
            throw invalid_argument("Too many arguments for save-rates");
          }
          command.expenseId = ParseNumber<ExpenseId>(arg, "expense id");
          break;
        default:
          throw invalid_argument("Unexpected argument '{}'", arg);
      }
      ++nbPositionalArgs;
    }
  }

  if (!optCommandType) {
    throw invalid_argument("Expected a command, see --help");
  }
  command.type = *optCommandType;
  if (command.type == FxTrackCommandType::kConvert && nbPositionalArgs < 3) {
    throw invalid_argument("convert expects <amount> <from> <to> [<expenseId>]");
  }
  if (command.type == FxTrackCommandType::kSaveRates && !command.expenseId) {
    throw invalid_argument("save-rates expects <expenseId>");
  }
  return command;
}

std::optional<FxTrackCommand> ParseFxTrackCommand(int argc, const char *const argv[]) {
  std::span<const char *const> args;
  if (argc > 1) {
    args = std::span<const char *const>(argv + 1, static_cast<std::size_t>(argc - 1));
  }
  return ParseFxTrackCommand(args);
}

}  // namespace fxt
