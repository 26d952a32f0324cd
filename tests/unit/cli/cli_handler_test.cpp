#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "docqa_cli/cli_handler.hpp"

namespace docqa_tests {

using docqa_cli::CliError;
using docqa_cli::CliHandler;
using docqa_cli::CliOptions;
using docqa_cli::Command;

class CliHandlerTest : public ::testing::Test {
 protected:
  CliOptions parse(std::vector<std::string> args) {
    args.insert(args.begin(), "docqa_cli");
    std::vector<char*> argv;
    for (auto& arg : args) {
      argv.push_back(arg.data());
    }
    return handler_.parse_arguments(static_cast<int>(argv.size()), argv.data());
  }

  CliHandler handler_{"http://127.0.0.1:8000/"};
};

TEST_F(CliHandlerTest, NoArgumentsShowsHelp) {
  EXPECT_EQ(parse({}).command, Command::Help);
}

TEST_F(CliHandlerTest, BuildsUrlsWithoutDoubleSlash) {
  EXPECT_EQ(handler_.get_api_base_url(), "http://127.0.0.1:8000");
  EXPECT_EQ(handler_.build_url("/ingest"), "http://127.0.0.1:8000/ingest");
}

TEST_F(CliHandlerTest, ParsesQueryWithTopK) {
  CliOptions options = parse({"query", "--question", "Who created Python?", "-k", "5"});

  EXPECT_EQ(options.command, Command::Query);
  EXPECT_EQ(options.question, "Who created Python?");
  EXPECT_EQ(options.top_k, 5);
}

TEST_F(CliHandlerTest, QueryTopKDefaultsToServerSetting) {
  EXPECT_EQ(parse({"q", "-q", "hi"}).top_k, 0);
}

TEST_F(CliHandlerTest, ParsesStructuredQuery) {
  CliOptions options = parse({"structured", "--question", "Who?", "--format", R"({"type":"object"})"});

  EXPECT_EQ(options.command, Command::Structured);
  EXPECT_EQ(options.response_format, R"({"type":"object"})");
}

TEST_F(CliHandlerTest, ParsesSimpleCommands) {
  EXPECT_EQ(parse({"ingest"}).command, Command::Ingest);
  EXPECT_EQ(parse({"clear"}).command, Command::Clear);
  EXPECT_EQ(parse({"documents"}).command, Command::Documents);
  EXPECT_EQ(parse({"upload", "--file", "notes.md"}).file_path, "notes.md");
  EXPECT_EQ(parse({"--help"}).command, Command::Help);
}

TEST_F(CliHandlerTest, RejectsBadArguments) {
  EXPECT_THROW(parse({"frobnicate"}), CliError);
  EXPECT_THROW(parse({"query"}), CliError);
  EXPECT_THROW(parse({"query", "--question"}), CliError);
  EXPECT_THROW(parse({"query", "--question", "hi", "--top-k", "zero"}), CliError);
  EXPECT_THROW(parse({"query", "--question", "hi", "--top-k", "-2"}), CliError);
  EXPECT_THROW(parse({"structured", "--question", "hi"}), CliError);
  EXPECT_THROW(parse({"upload"}), CliError);
  EXPECT_THROW(parse({"upload", "--path", "x"}), CliError);
}

}  // namespace docqa_tests
