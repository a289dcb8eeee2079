#include "graph/neo4j_graph_backend.hpp"
#include "SystemMonitor.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <array>
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>

namespace code_intelligence {

using json = nlohmann::json;

namespace {

constexpr std::array<const char*, 9> kLabels = {
    "Project", "File", "Function", "Method", "Class", "Struct", "Constant", "Variable", "Import"};
constexpr std::array<const char*, 5> kRelationshipTypes = {
    "CONTAINS", "IMPORTS", "DEPENDS_ON", "INHERITS_FROM", "CALLS"};

const char* kNodeColumns =
    "RETURN n.id, n.label, n.name, n.project_id, n.file_path, properties(n)";
const char* kRelColumns =
    "RETURN a.id, b.id, type(r), r.weight, properties(r)";

} // namespace

Neo4jGraphBackend::Neo4jGraphBackend(GraphConfig config)
    : config_(std::move(config)), endpoint_(commit_endpoint(config_.uri, config_.database)) {}

std::string Neo4jGraphBackend::commit_endpoint(const std::string& uri, const std::string& database) {
    std::string scheme = "http";
    std::string rest = uri;
    size_t sep = uri.find("://");
    if (sep != std::string::npos) {
        scheme = uri.substr(0, sep);
        rest = uri.substr(sep + 3);
    }
    std::string host = rest.substr(0, rest.find('/'));

    if (scheme == "bolt" || scheme == "neo4j" || scheme == "bolt+s" || scheme == "neo4j+s") {
        // Bolt port maps to the HTTP connector.
        size_t colon = host.rfind(':');
        if (colon != std::string::npos) host = host.substr(0, colon);
        host += ":7474";
        scheme = (ends_with(scheme, "+s")) ? "https" : "http";
    }
    return scheme + "://" + host + "/db/" + (database.empty() ? "neo4j" : database) + "/tx/commit";
}

bool Neo4jGraphBackend::is_known_label(const std::string& label) {
    return std::find(kLabels.begin(), kLabels.end(), label) != kLabels.end();
}

bool Neo4jGraphBackend::is_known_relationship(const std::string& type) {
    return std::find(kRelationshipTypes.begin(), kRelationshipTypes.end(), type) != kRelationshipTypes.end();
}

std::optional<json> Neo4jGraphBackend::run(const json& statements) {
    SystemMonitor::ScopedLatency timer(SystemMonitor::global_graph_latency_ms);

    std::string payload = json{{"statements", statements}}.dump(-1, ' ', false, json::error_handler_t::replace);
    cpr::Response r = cpr::Post(cpr::Url{endpoint_},
                                cpr::Authentication{config_.user, config_.password, cpr::AuthMode::BASIC},
                                cpr::Body{payload},
                                cpr::Header{{"Content-Type", "application/json"}, {"Accept", "application/json"}},
                                cpr::Timeout{config_.timeout_ms});

    if (r.error.code != cpr::ErrorCode::OK) {
        spdlog::warn("⚠️ Neo4j unreachable at {}: {}", endpoint_, r.error.message);
        return std::nullopt;
    }
    if (r.status_code != 200) {
        spdlog::warn("⚠️ Neo4j HTTP {}: {}", r.status_code, utf8_safe_substr(r.text, 300));
        return std::nullopt;
    }

    try {
        auto body = json::parse(r.text);
        if (body.contains("errors") && !body["errors"].empty()) {
            spdlog::warn("⚠️ Cypher error: {}", body["errors"][0].value("message", "unknown"));
            return std::nullopt;
        }
        return body.value("results", json::array());
    } catch (const json::exception& e) {
        spdlog::error("❌ Neo4j returned malformed JSON: {}", e.what());
        return std::nullopt;
    }
}

std::optional<json> Neo4jGraphBackend::run_one(const std::string& cypher, const json& params) {
    auto results = run(json::array({{{"statement", cypher}, {"parameters", params}}}));
    if (!results || results->empty()) return std::nullopt;
    return (*results)[0];
}

bool Neo4jGraphBackend::connect() {
    if (connected_) return true;
    connected_ = run_one("RETURN 1", json::object()).has_value();
    if (connected_) {
        // Index on the merge key.
        if (!run_one("CREATE INDEX code_node_id IF NOT EXISTS FOR (n:CodeNode) ON (n.id)", json::object())) {
            spdlog::debug("Neo4j index creation skipped");
        }
        spdlog::info("🧠 Connected to Neo4j at {}", endpoint_);
    }
    return connected_;
}

void Neo4jGraphBackend::disconnect() {
    connected_ = false;
}

json Neo4jGraphBackend::flatten_properties(const json& props) {
    // Neo4j properties must be primitives or homogeneous arrays.
    json flat = json::object();
    if (!props.is_object()) return flat;
    for (auto it = props.begin(); it != props.end(); ++it) {
        const json& v = it.value();
        if (v.is_null()) continue;
        if (v.is_object()) flat[it.key()] = v.dump();
        else if (v.is_array()) {
            bool primitive = std::all_of(v.begin(), v.end(), [](const json& e) { return e.is_string(); });
            flat[it.key()] = primitive ? v : json(v.dump());
        } else flat[it.key()] = v;
    }
    return flat;
}

bool Neo4jGraphBackend::upsert_node(const GraphNode& node) {
    if (!connected_ || node.id.empty()) return false;
    if (!is_known_label(node.label)) {
        spdlog::warn("⚠️ Refusing node {} with unknown label '{}'", node.id, node.label);
        return false;
    }
    std::string cypher =
        "MERGE (n:CodeNode {id: $id}) SET n = $props, n:" + node.label +
        ", n.id = $id, n.label = $label, n.name = $name, n.project_id = $project_id, n.file_path = $file_path"
        " RETURN n.id";
    json params = {
        {"id", node.id},
        {"label", node.label},
        {"name", node.name},
        {"project_id", node.project_id},
        {"file_path", node.file_path},
        {"props", flatten_properties(node.properties)}
    };
    return run_one(cypher, params).has_value();
}

WriteOutcome Neo4jGraphBackend::upsert_relationship(const GraphRelationship& rel) {
    if (!connected_) return WriteOutcome::Failed;
    if (!is_known_relationship(rel.type)) {
        spdlog::warn("⚠️ Refusing relationship with unknown type '{}'", rel.type);
        return WriteOutcome::Failed;
    }
    std::string cypher =
        "MATCH (a:CodeNode {id: $from}), (b:CodeNode {id: $to}) "
        "MERGE (a)-[r:" + rel.type + "]->(b) SET r.weight = $weight, r += $props RETURN count(r)";
    json params = {
        {"from", rel.from_id},
        {"to", rel.to_id},
        {"weight", rel.weight},
        {"props", flatten_properties(rel.properties)}
    };
    auto result = run_one(cypher, params);
    if (!result) return WriteOutcome::Failed;

    try {
        const auto data = result->value("data", json::array());
        if (data.empty() || data.at(0).at("row").at(0).get<long long>() == 0) return WriteOutcome::MissingEndpoint;
    } catch (const json::exception& e) {
        spdlog::error("❌ Unexpected MERGE result from Neo4j: {}", e.what());
        return WriteOutcome::Failed;
    }
    return WriteOutcome::Ok;
}

ClearResult Neo4jGraphBackend::delete_project(const std::string& project_id) {
    ClearResult cleared;
    if (!connected_) return cleared;
    json params = {{"project_id", project_id}};
    cleared.relationships_removed = count_query(
        "MATCH (n:CodeNode {project_id: $project_id})-[r]-() WITH DISTINCT r DELETE r RETURN count(r)", params);
    cleared.nodes_removed = count_query(
        "MATCH (n:CodeNode {project_id: $project_id}) DELETE n RETURN count(n)", params);
    return cleared;
}

ClearResult Neo4jGraphBackend::delete_file_nodes(const std::string& project_id, const std::string& file_path) {
    ClearResult cleared;
    if (!connected_) return cleared;
    json params = {{"project_id", project_id}, {"file_path", file_path}};
    const std::string match =
        "MATCH (n:CodeNode {project_id: $project_id, file_path: $file_path}) WHERE NOT n:Project ";
    cleared.relationships_removed = count_query(
        match + "MATCH (n)-[r]-() WITH DISTINCT r DELETE r RETURN count(r)", params);
    cleared.nodes_removed = count_query(match + "DELETE n RETURN count(n)", params);
    return cleared;
}

size_t Neo4jGraphBackend::count_query(const std::string& cypher, const json& params) {
    auto result = run_one(cypher, params);
    if (!result) return 0;
    try {
        const auto data = result->value("data", json::array());
        if (data.empty()) return 0;
        return data.at(0).at("row").at(0).get<size_t>();
    } catch (const json::exception& e) {
        spdlog::error("❌ Unexpected count result from Neo4j: {}", e.what());
        return 0;
    }
}

size_t Neo4jGraphBackend::node_count() {
    if (!connected_) return 0;
    return count_query("MATCH (n:CodeNode) RETURN count(n)", json::object());
}

size_t Neo4jGraphBackend::relationship_count() {
    if (!connected_) return 0;
    return count_query("MATCH (:CodeNode)-[r]->(:CodeNode) RETURN count(r)", json::object());
}

GraphNode Neo4jGraphBackend::node_from_row(const json& row) {
    GraphNode node;
    auto text = [&](size_t i) { return row.at(i).is_string() ? row.at(i).get<std::string>() : std::string(); };
    node.id = text(0);
    node.label = text(1);
    node.name = text(2);
    node.project_id = text(3);
    node.file_path = text(4);
    node.properties = row.at(5).is_object() ? row.at(5) : json::object();
    for (const char* key : {"id", "label", "name", "project_id", "file_path"}) node.properties.erase(key);
    return node;
}

GraphRelationship Neo4jGraphBackend::relationship_from_row(const json& row) {
    GraphRelationship rel;
    rel.from_id = row.at(0).get<std::string>();
    rel.to_id = row.at(1).get<std::string>();
    rel.type = row.at(2).get<std::string>();
    rel.weight = row.at(3).is_number() ? row.at(3).get<double>() : 1.0;
    rel.properties = row.at(4).is_object() ? row.at(4) : json::object();
    rel.properties.erase("weight");
    return rel;
}

std::optional<GraphNode> Neo4jGraphBackend::get_node(const std::string& id) {
    if (!connected_) return std::nullopt;
    auto result = run_one(std::string("MATCH (n:CodeNode {id: $id}) ") + kNodeColumns, {{"id", id}});
    if (!result) return std::nullopt;
    try {
        const auto data = result->value("data", json::array());
        if (data.empty()) return std::nullopt;
        return node_from_row(data.at(0).at("row"));
    } catch (const json::exception& e) {
        spdlog::error("❌ Unexpected node row from Neo4j: {}", e.what());
        return std::nullopt;
    }
}

std::vector<GraphRelationship> Neo4jGraphBackend::relationships_query(const std::string& cypher, const json& params) {
    std::vector<GraphRelationship> out;
    auto result = run_one(cypher, params);
    if (!result) return out;
    try {
        for (const auto& entry : result->value("data", json::array())) {
            out.push_back(relationship_from_row(entry.at("row")));
        }
    } catch (const json::exception& e) {
        spdlog::error("❌ Unexpected relationship row from Neo4j: {}", e.what());
    }
    return out;
}

std::vector<GraphRelationship> Neo4jGraphBackend::outgoing(const std::string& id) {
    if (!connected_) return {};
    return relationships_query(
        std::string("MATCH (a:CodeNode {id: $id})-[r]->(b:CodeNode) ") + kRelColumns + " ORDER BY type(r), b.id",
        {{"id", id}});
}

std::vector<GraphRelationship> Neo4jGraphBackend::incoming(const std::string& id) {
    if (!connected_) return {};
    return relationships_query(
        std::string("MATCH (a:CodeNode)-[r]->(b:CodeNode {id: $id}) ") + kRelColumns + " ORDER BY type(r), a.id",
        {{"id", id}});
}

std::vector<GraphNode> Neo4jGraphBackend::project_nodes(const std::string& project_id) {
    std::vector<GraphNode> out;
    if (!connected_) return out;
    auto result = run_one(std::string("MATCH (n:CodeNode {project_id: $project_id}) ") + kNodeColumns +
                              " ORDER BY n.id",
                          {{"project_id", project_id}});
    if (!result) return out;
    try {
        for (const auto& entry : result->value("data", json::array())) out.push_back(node_from_row(entry.at("row")));
    } catch (const json::exception& e) {
        spdlog::error("❌ Unexpected node row from Neo4j: {}", e.what());
    }
    return out;
}

std::vector<GraphRelationship> Neo4jGraphBackend::project_relationships(const std::string& project_id) {
    if (!connected_) return {};
    return relationships_query(
        std::string("MATCH (a:CodeNode {project_id: $project_id})-[r]->(b:CodeNode) ") + kRelColumns +
            " ORDER BY a.id, type(r), b.id",
        {{"project_id", project_id}});
}

} // namespace code_intelligence
