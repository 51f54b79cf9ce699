/*
 * kanboard C++ - Board tool (JSON surface) tests
 */
#include <catch2/catch.hpp>
#include "test_support.hpp"

#include <kanboard/core/board_tool.hpp>
#include <kanboard/core/config.hpp>

using namespace kanboard;
using kanboard::testing::EngineFixture;

namespace {

struct ToolFixture : EngineFixture {
    BoardTool tool;

    ToolFixture() : EngineFixture(1), tool(engine.get()) {
        tool.init(Config());
    }

    Json call(const std::string& action, const Json& params) {
        return tool.execute(action, params).to_json();
    }

    std::string add_task(const std::string& title) {
        Json params;
        params["title"] = title;
        Json r = call("add", params);
        return r["task"]["id"].get<std::string>();
    }
};

} // anonymous namespace

TEST_CASE("Every action is listed with a schema", "[tool]") {
    ToolFixture fx;
    std::vector<std::string> actions = fx.tool.actions();
    std::vector<AgentTool> tools = fx.tool.get_agent_tools();
    REQUIRE(tools.size() == actions.size());

    for (size_t i = 0; i < tools.size(); ++i) {
        CHECK(tools[i].name == actions[i]);
        CHECK_FALSE(tools[i].description.empty());
        Json schema = tools[i].input_schema();
        CHECK(schema["type"] == "object");
        CHECK(schema["properties"].is_object());
    }

    Json add_schema = tools[0].input_schema();
    CHECK(add_schema["required"] == Json::array({"title"}));
}

TEST_CASE("add, move and show through JSON", "[tool]") {
    ToolFixture fx;

    Json params;
    params["title"] = "Write the parser";
    params["priority"] = "high";
    params["labels"] = Json::array({"core"});
    params["actor"] = "human";
    Json added = fx.call("add", params);
    REQUIRE(added["success"] == true);
    const std::string id = added["task"]["id"];
    CHECK(added["task"]["column"] == "Backlog");
    CHECK(added["task"]["createdBy"] == "human");

    Json move;
    move["id"] = id;
    move["column"] = "in progress";
    Json moved = fx.call("move", move);
    REQUIRE(moved["success"] == true);
    CHECK(moved["task"]["column"] == "In Progress");

    Json show;
    show["id"] = id;
    Json shown = fx.call("show", show);
    REQUIRE(shown["success"] == true);
    CHECK(shown["task"]["priority"] == "high");
    CHECK(shown["task"]["comments"].is_array());
}

TEST_CASE("Errors carry their kind", "[tool]") {
    ToolFixture fx;

    Json unknown_field;
    unknown_field["title"] = "x";
    unknown_field["owner"] = "me";
    Json r = fx.call("add", unknown_field);
    CHECK(r["success"] == false);
    CHECK(r["code"] == "ValidationError");

    Json ghost;
    ghost["id"] = "ghost";
    ghost["column"] = "Done";
    r = fx.call("move", ghost);
    CHECK(r["code"] == "NotFound");

    std::string a = fx.add_task("A");
    std::string b = fx.add_task("B");
    Json first;
    first["id"] = a;
    first["column"] = "In Progress";
    REQUIRE(fx.call("move", first)["success"] == true);
    Json second;
    second["id"] = b;
    second["column"] = "In Progress";
    r = fx.call("move", second);
    CHECK(r["code"] == "WipLimitExceeded");

    Json block;
    block["id"] = b;
    block["blockedBy"] = a;
    REQUIRE(fx.call("block", block)["success"] == true);
    Json review;
    review["id"] = b;
    review["column"] = "Review";
    r = fx.call("move", review);
    CHECK(r["code"] == "DependencyUnresolved");

    r = fx.call("teleport", Json::object());
    CHECK(r["success"] == false);

    r = fx.call("move", Json::array());
    CHECK(r["code"] == "ValidationError");
}

TEST_CASE("sweep reports a rollback", "[tool]") {
    ToolFixture fx;
    std::string a = fx.add_task("A");
    std::string b = fx.add_task("B");

    Json params;
    params["taskIds"] = Json::array({a, b});
    params["column"] = "In Progress";
    Json r = fx.call("sweep", params);
    CHECK(r["success"] == false);
    CHECK(r["code"] == "WipLimitExceeded");
    CHECK(r["rolledBack"] == true);
    REQUIRE(r["results"].size() == 2);
    CHECK(r["results"][0]["success"] == true);
    CHECK(r["results"][1]["success"] == false);

    Json list;
    list["column"] = "Backlog";
    CHECK(fx.call("list", list)["count"] == 2);

    Json ok;
    ok["moves"] = Json::array();
    Json m1;
    m1["id"] = a;
    m1["column"] = "Todo";
    Json m2;
    m2["taskId"] = b;
    m2["column"] = "In Progress";
    ok["moves"].push_back(m1);
    ok["moves"].push_back(m2);
    r = fx.call("sweep", ok);
    REQUIRE(r["success"] == true);
    CHECK(r["moved"] == 2);
}

TEST_CASE("Board management actions", "[tool]") {
    ToolFixture fx;

    Json create;
    create["name"] = "web";
    create["columns"] = Json::array({"Design", "Build"});
    create["wipLimits"] = {{"Build", 2}};
    Json r = fx.call("create_board", create);
    REQUIRE(r["success"] == true);
    CHECK(r["board"]["columns"].size() == 4);

    Json add;
    add["title"] = "Landing page";
    add["board"] = "web";
    add["column"] = "Design";
    REQUIRE(fx.call("add", add)["success"] == true);

    Json boards = fx.call("boards", Json::object());
    REQUIRE(boards["success"] == true);
    CHECK(boards["count"] == 1);

    Json active = fx.call("active", Json::object());
    CHECK(active["board"]["name"] == "web");

    Json stats_params;
    stats_params["board"] = "web";
    Json stats = fx.call("stats", stats_params);
    CHECK(stats["total"] == 1);

    Json column;
    column["board"] = "web";
    column["name"] = "Design";
    column["remove"] = true;
    REQUIRE(fx.call("column", column)["success"] == true);

    Json board_params;
    board_params["board"] = "web";
    Json view = fx.call("board", board_params);
    REQUIRE(view["success"] == true);
    CHECK(view["columns"][0]["name"] == "Backlog");
    CHECK(view["columns"][0]["tasks"].size() == 1);

    Json del;
    del["name"] = "web";
    CHECK(fx.call("delete_board", del)["deleted"] == "web");
}

TEST_CASE("Comments, clear and archive through JSON", "[tool]") {
    ToolFixture fx;
    std::string a = fx.add_task("A");

    Json comment;
    comment["id"] = a;
    comment["content"] = "started";
    comment["author"] = "human";
    Json r = fx.call("comment", comment);
    REQUIRE(r["success"] == true);
    CHECK(r["comment"]["author"] == "human");

    Json comments;
    comments["id"] = a;
    CHECK(fx.call("comments", comments)["count"] == 1);

    Json done;
    done["id"] = a;
    done["column"] = "Done";
    REQUIRE(fx.call("move", done)["success"] == true);
    CHECK(fx.call("clear", Json::object())["archived"] == 1);

    Json archived = fx.call("archived", Json::object());
    REQUIRE(archived["count"] == 1);
    CHECK(archived["tasks"][0]["id"] == a);
}

TEST_CASE("GitHub webhook payloads", "[tool]") {
    ToolFixture fx;

    Json payload;
    payload["action"] = "opened";
    payload["issue"] = {{"number", 7}, {"title", "Docs are stale"}, {"body", ""},
                        {"labels", Json::array({{{"name", "docs"}}})},
                        {"html_url", "https://github.com/acme/site/issues/7"}};
    payload["repository"] = {{"full_name", "acme/site"}};

    Json r = fx.call("github_issue", payload);
    REQUIRE(r["success"] == true);
    CHECK(r["processed"] == true);
    const std::string id = r["taskId"];

    Json show;
    show["id"] = id;
    show["board"] = "acme-site";
    Json shown = fx.call("show", show);
    REQUIRE(shown["success"] == true);
    CHECK(shown["task"]["labels"] == Json::array({"docs"}));

    payload["action"] = "edited";
    CHECK(fx.call("github_issue", payload)["processed"] == false);
}

TEST_CASE("An uninitialized tool refuses to run", "[tool]") {
    EngineFixture fx(1);
    BoardTool tool(fx.engine.get());
    ToolResult r = tool.execute("list", Json::object());
    CHECK_FALSE(r.success);
    CHECK_FALSE(tool.is_initialized());
}

TEST_CASE("link_project records the project folder", "[tool]") {
    ToolFixture fx;
    fx.add_task("A");

    Json params;
    params["folder"] = "/tmp";
    Json r = fx.call("link_project", params);
    REQUIRE(r["success"] == true);
    CHECK(r["board"] == "default");
    CHECK(r["projectRoot"] == "/tmp");

    params["folder"] = "/kanboard/no/such/folder";
    r = fx.call("link_project", params);
    CHECK(r["code"] == "NotFound");

    r = fx.call("link_project", Json::object());
    CHECK(r["code"] == "ValidationError");
}

TEST_CASE("Integer parameters out of range are rejected", "[tool]") {
    ToolFixture fx;

    Json column;
    column["name"] = "QA";
    column["position"] = 4294967297LL;
    Json r = fx.call("column", column);
    CHECK(r["success"] == false);
    CHECK(r["code"] == "ValidationError");

    column["position"] = "2";
    column["wipLimit"] = "99999999999999999999";
    CHECK(fx.call("column", column)["code"] == "ValidationError");

    Json stale;
    stale["days"] = -1;
    CHECK(fx.call("archive_stale", stale)["success"] == false);
}
