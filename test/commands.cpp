#include "CommandRegistry.hpp"
#include "JCmpError.hpp"
#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace std;
using namespace jcmp;

namespace {
	// temporary JSON file removed at scope exit
	struct TempDoc
	{
		filesystem::path path;

		TempDoc(const string &name, const string &content)
			: path(filesystem::temp_directory_path() / name)
		{
			ofstream(path) << content;
		}

		~TempDoc()
		{
			error_code ec;
			filesystem::remove(path, ec);
		}

		[[nodiscard]] string str() const { return path.string(); }
	};

	struct Run
	{
		int code;
		string out;
		string err;
	};

	Run run(const string &command, const vector<string> &args, const ordered_json &options = ordered_json::object())
	{
		ostringstream out, err;
		const int code = CommandRegistry::instance().run_command(command, args, options, out, err);
		return Run{code, out.str(), err.str()};
	}
}

TEST_CASE("Registry knows the comparison commands", "[commands][registry]")
{
	auto &registry = CommandRegistry::instance();
	REQUIRE(registry.has_command("diff"));
	REQUIRE(registry.has_command("path"));
	REQUIRE(registry.has_command("value"));
	REQUIRE_FALSE(registry.has_command("merge"));
	REQUIRE(registry.usages().size() == 3);
	REQUIRE(registry.usages()[0].first == "diff LEFT RIGHT");
}

TEST_CASE("Unknown command or wrong arity is a usage error", "[commands][registry][error]")
{
	REQUIRE_THROWS_AS(run("merge", {}), UsageError);
	REQUIRE_THROWS_AS(run("diff", {"only-one.json"}), UsageError);
}

TEST_CASE("diff prints a text report and sets the exit code", "[commands][diff]")
{
	TempDoc left("jcmp_cmd_left.json", R"({"name":"John","age":30})");
	TempDoc right("jcmp_cmd_right.json", R"({"name":"John","age":31})");

	Run r = run("diff", {left.str(), right.str()});
	REQUIRE(r.code == exit_code::different);
	REQUIRE(r.out == "age: value differs: 30 vs 31\n1 difference(s)\n");

	Run same = run("diff", {left.str(), left.str()});
	REQUIRE(same.code == exit_code::equal);
	REQUIRE(same.out == "documents are equal\n");
}

TEST_CASE("diff in JSON format", "[commands][diff][json]")
{
	TempDoc left("jcmp_cmd_left2.json", "[1,2]");
	TempDoc right("jcmp_cmd_right2.json", "[1,2,3]");

	ordered_json options = {{"format", "json"}, {"indent", -1}};
	Run r = run("diff", {left.str(), right.str()}, options);
	REQUIRE(r.code == exit_code::different);
	REQUIRE(ordered_json::parse(r.out) == ordered_json::parse(R"({
		"equal": false,
		"differences": [{"path": "[2]", "segments": [2], "kind": "ExtraInRight", "rightValue": 3}]
	})"));
}

TEST_CASE("quiet prints nothing", "[commands][quiet]")
{
	TempDoc left("jcmp_cmd_left3.json", R"({"a":1})");
	TempDoc right("jcmp_cmd_right3.json", R"({"a":2})");
	Run r = run("diff", {left.str(), right.str()}, {{"quiet", true}});
	REQUIRE(r.code == exit_code::different);
	REQUIRE(r.out.empty());
}

TEST_CASE("path compares the values at one location", "[commands][path]")
{
	TempDoc left("jcmp_cmd_left4.json", R"({"age":30,"name":"John"})");
	TempDoc right("jcmp_cmd_right4.json", R"({"age":31,"name":"John"})");

	Run differs = run("path", {left.str(), right.str(), "age"});
	REQUIRE(differs.code == exit_code::different);
	REQUIRE(differs.out == "false\n");

	Run same = run("path", {left.str(), right.str(), "$.name"}, {{"format", "json"}, {"indent", -1}});
	REQUIRE(same.code == exit_code::equal);
	REQUIRE(same.out == "{\"equal\":true}\n");
}

TEST_CASE("path errors go to the error stream with exit code 2", "[commands][path][error]")
{
	TempDoc doc("jcmp_cmd_doc5.json", R"({"a":{"b":1}})");

	Run missing = run("path", {doc.str(), doc.str(), "a.c"});
	REQUIRE(missing.code == exit_code::error);
	REQUIRE(missing.out.empty());
	REQUIRE(missing.err == "jcmp: path segment 'c' not found at 'a'\n");

	Run malformed = run("path", {doc.str(), doc.str(), "a[x]"}, {{"format", "json"}});
	REQUIRE(malformed.code == exit_code::error);
	REQUIRE(ordered_json::parse(malformed.out)["error"]["error"] == "MalformedExpression");
}

TEST_CASE("value compares against JSON text", "[commands][value]")
{
	TempDoc doc("jcmp_cmd_doc6.json", R"({"name":"John","age":30})");

	REQUIRE(run("value", {doc.str(), "name", R"("John")"}).code == exit_code::equal);
	REQUIRE(run("value", {doc.str(), "age", "30"}).code == exit_code::equal);
	REQUIRE(run("value", {doc.str(), "age", "30.0"}).code == exit_code::equal);
	REQUIRE(run("value", {doc.str(), "age", R"("30")"}).code == exit_code::different);
}

TEST_CASE("value accepts negative and very large numbers", "[commands][value][number]")
{
	TempDoc doc("jcmp_cmd_doc7.json", R"({"delta":-1,"id":18446744073709551615})");

	REQUIRE(run("value", {doc.str(), "delta", "-1"}).code == exit_code::equal);
	REQUIRE(run("value", {doc.str(), "delta", "-1.0"}).code == exit_code::equal);
	REQUIRE(run("value", {doc.str(), "id", "-1"}).code == exit_code::different);
	REQUIRE(run("value", {doc.str(), "id", "18446744073709551615"}).code == exit_code::equal);
}

TEST_CASE("Unreadable or malformed documents throw", "[commands][error]")
{
	TempDoc broken("jcmp_cmd_broken.json", R"({"a": )");
	TempDoc good("jcmp_cmd_good.json", "{}");

	REQUIRE_THROWS_AS(run("diff", {broken.str(), good.str()}), ParseError);
	REQUIRE_THROWS_AS(run("value", {good.str(), "a", "not json"}), ParseError);
	REQUIRE_THROWS_AS(run("diff", {good.str(), "/nonexistent/jcmp/file.json"}), runtime_error);
	REQUIRE_THROWS_AS(run("diff", {"-", "-"}), UsageError);
}

TEST_CASE("ParseError names the document and offset", "[commands][error][parse]")
{
	TempDoc broken("jcmp_cmd_broken2.json", R"({"a": ])");
	TempDoc good("jcmp_cmd_good2.json", "{}");
	try
	{
		run("diff", {good.str(), broken.str()});
		FAIL("expected ParseError");
	}
	catch (const ParseError &e)
	{
		REQUIRE(e.document() == broken.str());
		REQUIRE(e.byte() > 0);
		REQUIRE(string(e.what()).find(broken.str()) != string::npos);
	}
}
