#include <catch2/catch_test_macros.hpp>
#include "log.hpp"
#include "registry.hpp"
#include "test_support.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

using namespace toolbelt;
using namespace toolbelt_test;

namespace {

// Records the arguments of every call it receives
struct RecordingBackend : ToolBackend {
    std::vector<std::string> called;
    Arguments last;
    bool throw_on_call = false;

    ToolResult execute(const std::string& tool_name, const Arguments& args) override {
        called.push_back(tool_name);
        last = args;
        if (throw_on_call) throw std::runtime_error("backend exploded");
        return ToolResult::text("ok");
    }
};

std::vector<ToolDefinition> test_tools() {
    ParamSpec mode = with_default(string_param("mode"), "fast");
    mode.enum_values = {"fast", "slow"};

    ParamSpec files = required(sandboxed(string_array_param("files")));
    files.min_items = 1;

    ParamSpec edits = required(string_param("edits"));
    edits.type = ParamType::ObjectArray;
    edits.item_fields = {"oldText", "newText"};

    ToolDefinition in_repo;
    in_repo.name = "in_repo";
    in_repo.description = "Operate on files inside a repository";
    in_repo.params = {
        required(sandboxed(string_param("repo"))),
        sandboxed(string_param("file")),
        sandboxed(string_array_param("paths")),
    };
    in_repo.base_param = "repo";

    return {
        {"typed", "Every parameter type",
         {required(string_param("name")),
          number_param("count"),
          with_default(bool_param("dry"), false),
          mode},
         ""},
        {"move", "Move a file",
         {required(sandboxed(string_param("source"))),
          required(sandboxed(string_param("destination")))},
         ""},
        {"many", "Several files", {files}, ""},
        {"edit", "Edits", {edits}, ""},
        {"init", "Defaulted path", {with_default(sandboxed(string_param("path")), ".")}, ""},
        in_repo,
    };
}

struct RegistryFixture {
    TempDir tmp;
    std::string root;
    PathSandbox sandbox;
    RecordingBackend backend;
    std::shared_ptr<spdlog::logger> log = make_null_logger();
    ToolRegistry registry;

    RegistryFixture()
        : root(tmp / "root"),
          sandbox(make_root(root)),
          registry(test_tools(), backend, sandbox, *log) {}

    static std::vector<std::string> make_root(const std::string& dir) {
        write_file(dir + "/repo/a.txt", "a");
        return {dir};
    }

    CallOutcome call(const std::string& name, const std::string& args_json) {
        return registry.call(name, nlohmann::json::parse(args_json));
    }
};

std::string error_data(const CallOutcome& outcome) {
    REQUIRE(outcome.error.has_value());
    return outcome.error->data.get<std::string>();
}

} // namespace

// ── Listing ─────────────────────────────────────────────────────

TEST_CASE("ToolRegistry: list_json is built once and stable", "[registry]") {
    RegistryFixture f;
    const auto& first = f.registry.list_json();
    std::string before = first.dump();
    f.call("typed", R"({"name":"x"})");
    REQUIRE(f.registry.list_json().dump() == before);
    REQUIRE(&f.registry.list_json() == &first);
    REQUIRE(first["tools"].size() == 6);
}

TEST_CASE("ToolDefinition: schema carries defaults, enums and item types", "[registry]") {
    auto tools = test_tools();
    auto typed = tools[0].to_json();
    auto props = typed["inputSchema"]["properties"];
    REQUIRE(props["count"]["type"] == "number");
    REQUIRE(props["dry"]["default"] == false);
    REQUIRE(props["mode"]["enum"] == nlohmann::json::array({"fast", "slow"}));
    REQUIRE(props["mode"]["default"] == "fast");
    REQUIRE(typed["inputSchema"]["required"] == nlohmann::json::array({"name"}));

    auto many = tools[2].to_json()["inputSchema"]["properties"]["files"];
    REQUIRE(many["type"] == "array");
    REQUIRE(many["items"]["type"] == "string");
    REQUIRE(many["minItems"] == 1);

    auto edits = tools[3].to_json()["inputSchema"]["properties"]["edits"];
    REQUIRE(edits["items"]["type"] == "object");
    REQUIRE(edits["items"]["required"] == nlohmann::json::array({"oldText", "newText"}));
}

TEST_CASE("ToolDefinition: no required key when nothing is required", "[registry]") {
    ToolDefinition def{"empty", "No arguments", {}, ""};
    auto schema = def.to_json()["inputSchema"];
    REQUIRE_FALSE(schema.contains("required"));
    REQUIRE(schema["properties"].is_object());
}

// ── Decode ──────────────────────────────────────────────────────

TEST_CASE("ToolRegistry: missing required argument", "[registry]") {
    RegistryFixture f;
    auto out = f.call("typed", "{}");
    REQUIRE(out.error->code == rpc_codes::InvalidParams);
    REQUIRE(out.error->message == "Invalid arguments");
    REQUIRE(error_data(out) == "name parameter is required");
    REQUIRE(f.backend.called.empty());
}

TEST_CASE("ToolRegistry: null counts as missing", "[registry]") {
    RegistryFixture f;
    auto out = f.call("typed", R"({"name":null})");
    REQUIRE(error_data(out) == "name parameter is required");
}

TEST_CASE("ToolRegistry: wrong types are rejected", "[registry]") {
    RegistryFixture f;
    REQUIRE(error_data(f.call("typed", R"({"name":5})")) == "name parameter must be a string");
    REQUIRE(error_data(f.call("typed", R"({"name":"x","count":"3"})")) ==
            "count parameter must be a number");
    REQUIRE(error_data(f.call("typed", R"({"name":"x","dry":"yes"})")) ==
            "dry parameter must be a boolean");
    REQUIRE(error_data(f.call("many", R"({"files":["a",1]})")) ==
            "files parameter must be an array of strings");
    REQUIRE(f.backend.called.empty());
}

TEST_CASE("ToolRegistry: enum membership", "[registry]") {
    RegistryFixture f;
    REQUIRE(error_data(f.call("typed", R"({"name":"x","mode":"medium"})")) ==
            "mode must be one of: fast, slow");
    auto ok = f.call("typed", R"({"name":"x","mode":"slow"})");
    REQUIRE_FALSE(ok.error.has_value());
    REQUIRE(f.backend.last.str("mode") == "slow");
}

TEST_CASE("ToolRegistry: defaults are filled", "[registry]") {
    RegistryFixture f;
    auto out = f.call("typed", R"({"name":"x"})");
    REQUIRE_FALSE(out.error.has_value());
    REQUIRE(f.backend.last.str("name") == "x");
    REQUIRE(f.backend.last.str("mode") == "fast");
    REQUIRE(f.backend.last.flag("dry", true) == false);
    REQUIRE_FALSE(f.backend.last.has("count"));
    REQUIRE_FALSE(f.backend.last.opt_number("count").has_value());
}

TEST_CASE("ToolRegistry: numbers are passed through", "[registry]") {
    RegistryFixture f;
    f.call("typed", R"({"name":"x","count":12})");
    REQUIRE(f.backend.last.number("count") == 12);
}

TEST_CASE("ToolRegistry: min_items", "[registry]") {
    RegistryFixture f;
    REQUIRE(error_data(f.call("many", R"({"files":[]})")) ==
            "files must contain at least 1 item(s)");
}

TEST_CASE("ToolRegistry: object array items need their string fields", "[registry]") {
    RegistryFixture f;
    REQUIRE(error_data(f.call("edit", R"({"edits":[{"oldText":"a"}]})")) ==
            "edits[0].newText must be a string");
    REQUIRE(error_data(f.call("edit", R"({"edits":["a"]})")) ==
            "edits parameter must be an array of objects");
    auto ok = f.call("edit", R"({"edits":[{"oldText":"a","newText":"b"}]})");
    REQUIRE_FALSE(ok.error.has_value());
    REQUIRE(f.backend.last.objects("edits").size() == 1);
}

TEST_CASE("ToolRegistry: arguments must be an object", "[registry]") {
    RegistryFixture f;
    auto out = f.registry.call("typed", nlohmann::json::array());
    REQUIRE(out.error->message == "Invalid params");
}

TEST_CASE("ToolRegistry: unknown tool", "[registry]") {
    RegistryFixture f;
    auto out = f.call("nope", "{}");
    REQUIRE(out.error->code == rpc_codes::InvalidParams);
    REQUIRE(out.error->message == "Unknown tool");
    REQUIRE(error_data(out) == "Tool not found: nope");
}

// ── Sandboxing ──────────────────────────────────────────────────

TEST_CASE("ToolRegistry: sandboxed argument is resolved, original kept", "[registry]") {
    RegistryFixture f;
    auto out = f.call("move", nlohmann::json{{"source", f.root + "/repo/../repo/a.txt"},
                                             {"destination", f.root + "/b.txt"}}.dump());
    REQUIRE_FALSE(out.error.has_value());
    REQUIRE(f.backend.last.str("source") == f.root + "/repo/a.txt");
    REQUIRE(f.backend.last.original("source") == f.root + "/repo/../repo/a.txt");
}

TEST_CASE("ToolRegistry: move is rejected when either side escapes", "[registry]") {
    RegistryFixture f;
    std::string inside = f.root + "/repo/a.txt";

    auto bad_dest = f.call("move", nlohmann::json{{"source", inside},
                                                  {"destination", "/etc/evil"}}.dump());
    REQUIRE(bad_dest.error->message == "Access denied");
    REQUIRE(error_data(bad_dest) == "destination: path outside allowed directories: /etc/evil");

    auto bad_source = f.call("move", nlohmann::json{{"source", "/etc/passwd"},
                                                    {"destination", f.root + "/p"}}.dump());
    REQUIRE(bad_source.error->message == "Access denied");
    REQUIRE(error_data(bad_source) == "source: path outside allowed directories: /etc/passwd");

    REQUIRE(f.backend.called.empty());
}

TEST_CASE("ToolRegistry: every array element is sandboxed", "[registry]") {
    RegistryFixture f;
    auto out = f.call("many", nlohmann::json{{"files", {f.root + "/repo/a.txt",
                                                        f.root + "/../x"}}}.dump());
    REQUIRE(out.error->message == "Access denied");
    REQUIRE(f.backend.called.empty());

    auto ok = f.call("many", nlohmann::json{{"files", {f.root + "/repo/a.txt"}}}.dump());
    REQUIRE_FALSE(ok.error.has_value());
    REQUIRE(f.backend.last.strings("files") == std::vector<std::string>{f.root + "/repo/a.txt"});
}

TEST_CASE("ToolRegistry: defaulted sandboxed argument is still checked", "[registry]") {
    RegistryFixture f;
    {
        CwdGuard cwd(f.root + "/repo");
        auto ok = f.call("init", "{}");
        REQUIRE_FALSE(ok.error.has_value());
        REQUIRE(f.backend.last.str("path") == f.root + "/repo");
    }
    {
        CwdGuard cwd(f.tmp.path);
        auto denied = f.call("init", "{}");
        REQUIRE(denied.error.has_value());
        REQUIRE(denied.error->message == "Access denied");
    }
}

TEST_CASE("ToolRegistry: base parameter anchors relative paths", "[registry]") {
    RegistryFixture f;
    std::string repo = f.root + "/repo";
    auto ok = f.call("in_repo", nlohmann::json{{"repo", repo},
                                               {"file", "a.txt"},
                                               {"paths", {".", "src/new.cpp"}}}.dump());
    REQUIRE_FALSE(ok.error.has_value());
    REQUIRE(f.backend.last.str("file") == repo + "/a.txt");
    REQUIRE(f.backend.last.original("file") == "a.txt");
    REQUIRE(f.backend.last.strings("paths") ==
            std::vector<std::string>{repo, repo + "/src/new.cpp"});
    REQUIRE(f.backend.last.original_strings("paths") ==
            std::vector<std::string>{".", "src/new.cpp"});
}

TEST_CASE("ToolRegistry: relative escape from the base is rejected", "[registry]") {
    RegistryFixture f;
    auto out = f.call("in_repo", nlohmann::json{{"repo", f.root + "/repo"},
                                                {"file", "../../outside.txt"}}.dump());
    REQUIRE(out.error->message == "Access denied");
    REQUIRE(error_data(out) == "file: path outside allowed directories: ../../outside.txt");
    REQUIRE(f.backend.called.empty());
}

// ── Backend failures ────────────────────────────────────────────

TEST_CASE("ToolRegistry: backend exception becomes an error result", "[registry]") {
    RegistryFixture f;
    f.backend.throw_on_call = true;
    auto out = f.call("typed", R"({"name":"x"})");
    REQUIRE_FALSE(out.error.has_value());
    REQUIRE(out.result.is_error);
    REQUIRE(out.result.first_text() == "Tool execution failed: backend exploded");
    REQUIRE(out.result.to_json()["isError"] == true);
}

TEST_CASE("ToolRegistry: call(params) validates the envelope", "[registry]") {
    RegistryFixture f;
    auto out = f.registry.call(nlohmann::json{{"arguments", nlohmann::json::object()}});
    REQUIRE(out.error->message == "Invalid params");

    auto ok = f.registry.call(nlohmann::json{{"name", "typed"},
                                             {"arguments", {{"name", "y"}}}});
    REQUIRE_FALSE(ok.error.has_value());
    REQUIRE(ok.result.first_text() == "ok");
}
