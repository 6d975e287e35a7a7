#include "CommandLine.hpp"
#include "CommandRegistry.hpp"
#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>

using namespace std;
using namespace jcmp;

static filesystem::path write_temp(const string &name, const string &content)
{
	const auto p = filesystem::temp_directory_path() / name;
	ofstream(p) << content;
	return p;
}

TEST_CASE("Command and positional arguments", "[cli][parse]")
{
	CommandLine cl = CommandLine::parse(vector<string>{"diff", "a.json", "b.json"});
	REQUIRE(cl.command == "diff");
	REQUIRE(cl.args == vector<string>{"a.json", "b.json"});
	REQUIRE(cl.options.empty());
	REQUIRE_FALSE(cl.config_file.has_value());
}

TEST_CASE("Options in both spellings, anywhere on the line", "[cli][parse][options]")
{
	CommandLine cl = CommandLine::parse(vector<string>{
		"--format=json", "value", "doc.json", "--indent", "4", "user.age", "-q", "30", "--log-level", "debug"
	});
	REQUIRE(cl.command == "value");
	REQUIRE(cl.args == vector<string>{"doc.json", "user.age", "30"});
	REQUIRE(cl.options["format"] == "json");
	REQUIRE(cl.options["indent"] == 4);
	REQUIRE(cl.options["quiet"] == true);
	REQUIRE(cl.options["log-level"] == "debug");
}

TEST_CASE("Lone dash and double dash are positional", "[cli][parse]")
{
	CommandLine cl = CommandLine::parse(vector<string>{"path", "-", "b.json", "--", "--weird"});
	REQUIRE(cl.args == vector<string>{"-", "b.json", "--weird"});
}

TEST_CASE("Negative numbers are positional", "[cli][parse][number]")
{
	CommandLine cl = CommandLine::parse(vector<string>{"value", "doc.json", "delta", "-1"});
	REQUIRE(cl.command == "value");
	REQUIRE(cl.args == vector<string>{"doc.json", "delta", "-1"});

	CommandLine fraction = CommandLine::parse(vector<string>{"value", "-q", "doc.json", "ratio", "-2.5"});
	REQUIRE(fraction.args == vector<string>{"doc.json", "ratio", "-2.5"});
	REQUIRE(fraction.options["quiet"] == true);

	CommandLine compact = CommandLine::parse(vector<string>{"--indent", "-1", "diff", "a", "b"});
	REQUIRE(compact.options["indent"] == -1);
	REQUIRE(compact.args == vector<string>{"a", "b"});
}

TEST_CASE("Help and version need no command", "[cli][parse]")
{
	REQUIRE(CommandLine::parse(vector<string>{"--help"}).help);
	REQUIRE(CommandLine::parse(vector<string>{"-h"}).help);
	REQUIRE(CommandLine::parse(vector<string>{"--version"}).version);
}

TEST_CASE("Invalid command lines are usage errors", "[cli][parse][error]")
{
	REQUIRE_THROWS_AS(CommandLine::parse(vector<string>{}), UsageError);
	REQUIRE_THROWS_AS(CommandLine::parse(vector<string>{"--bogus", "diff"}), UsageError);
	REQUIRE_THROWS_AS(CommandLine::parse(vector<string>{"-x", "diff"}), UsageError);
	REQUIRE_THROWS_AS(CommandLine::parse(vector<string>{"diff", "--format"}), UsageError);
	REQUIRE_THROWS_AS(CommandLine::parse(vector<string>{"diff", "--format=yaml"}), UsageError);
	REQUIRE_THROWS_AS(CommandLine::parse(vector<string>{"diff", "--indent", "two"}), UsageError);
	REQUIRE_THROWS_AS(CommandLine::parse(vector<string>{"diff", "--indent", "-3"}), UsageError);
	REQUIRE_THROWS_AS(CommandLine::parse(vector<string>{"diff", "--quiet=yes"}), UsageError);
}

TEST_CASE("Config file values are overridden by flags", "[cli][config]")
{
	const auto cfg = write_temp("jcmp_test_config.json", R"({"format": "json", "indent": 0, "quiet": true})");
	CommandLine cl = CommandLine::parse(vector<string>{"--config", cfg.string(), "--indent=8", "diff", "a", "b"});
	REQUIRE(cl.config_file == cfg.string());

	const ordered_json options = cl.effective_options();
	REQUIRE(CommandRegistry::get_option(options, "format", string("text")) == "json");
	REQUIRE(CommandRegistry::get_option(options, "indent", 2) == 8);
	REQUIRE(CommandRegistry::get_option(options, "quiet", false));
	REQUIRE_FALSE(CommandRegistry::get_option<string>(options, "log-level").has_value());
	filesystem::remove(cfg);
}

TEST_CASE("Invalid configuration files", "[cli][config][error]")
{
	const auto not_object = write_temp("jcmp_test_config_array.json", "[1]");
	REQUIRE_THROWS_AS(CommandLine::parse(vector<string>{"--config", not_object.string(), "diff", "a", "b"})
	                  .effective_options(), UsageError);

	const auto bad_type = write_temp("jcmp_test_config_type.json", R"({"indent": "2"})");
	REQUIRE_THROWS_AS(CommandLine::parse(vector<string>{"--config", bad_type.string(), "diff", "a", "b"})
	                  .effective_options(), UsageError);

	const auto unknown = write_temp("jcmp_test_config_key.json", R"({"colour": true})");
	REQUIRE_THROWS_AS(CommandLine::parse(vector<string>{"--config", unknown.string(), "diff", "a", "b"})
	                  .effective_options(), UsageError);

	filesystem::remove(not_object);
	filesystem::remove(bad_type);
	filesystem::remove(unknown);
}
