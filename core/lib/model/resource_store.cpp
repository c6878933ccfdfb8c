// flow_lint/model/resource_store.cpp - Agent directory loader
//
#include "flow_lint/model/resource_store.hpp"

#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <utility>
#include <vector>

namespace flow_lint
{

namespace
{

using json = nlohmann::json;
namespace fs = std::filesystem;

/// A known field has the wrong JSON type.
class MalformedField : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

// ----------------------------------------------------------------------------
// Field accessors
// ----------------------------------------------------------------------------

const json * find_field(const json & obj, const char * key)
{
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return nullptr;
  }
  return &*it;
}

/// Absent, null and empty strings all read as "no value".
std::optional<std::string> optional_string(const json & obj, const char * key)
{
  const json * v = find_field(obj, key);
  if (!v) return std::nullopt;
  if (!v->is_string()) {
    throw MalformedField(std::string("field '") + key + "' must be a string");
  }
  auto s = v->get<std::string>();
  if (s.empty()) return std::nullopt;
  return s;
}

const json & array_field(const json & obj, const char * key)
{
  static const json k_empty = json::array();
  const json * v = find_field(obj, key);
  if (!v) return k_empty;
  if (!v->is_array()) {
    throw MalformedField(std::string("field '") + key + "' must be an array");
  }
  return *v;
}

const json * object_field(const json & obj, const char * key)
{
  const json * v = find_field(obj, key);
  if (!v) return nullptr;
  if (!v->is_object()) {
    throw MalformedField(std::string("field '") + key + "' must be an object");
  }
  return v;
}

void require_object(const json & v, const char * what)
{
  if (!v.is_object()) {
    throw MalformedField(std::string(what) + " entries must be objects");
  }
}

/// A fulfillment counts as present when it is a non-empty object.
bool has_fulfillment(const json & obj, const char * key)
{
  const json * f = object_field(obj, key);
  return f != nullptr && !f->empty();
}

bool has_entry_action(const json & page)
{
  const json * ef = object_field(page, "entryFulfillment");
  if (!ef) return false;
  if (!array_field(*ef, "messages").empty()) return true;
  return optional_string(*ef, "webhook").has_value();
}

// ----------------------------------------------------------------------------
// Element parsers
// ----------------------------------------------------------------------------

std::vector<TransitionRoute> parse_routes(const json & obj)
{
  std::vector<TransitionRoute> routes;
  for (const auto & r : array_field(obj, "transitionRoutes")) {
    require_object(r, "transitionRoutes");
    TransitionRoute route;
    route.condition = optional_string(r, "condition");
    route.intent = optional_string(r, "intent");
    route.target_page = optional_string(r, "targetPage");
    route.target_flow = optional_string(r, "targetFlow");
    route.has_trigger_fulfillment = has_fulfillment(r, "triggerFulfillment");
    routes.push_back(std::move(route));
  }
  return routes;
}

std::vector<EventHandler> parse_handlers(const json & obj, const char * key)
{
  std::vector<EventHandler> handlers;
  for (const auto & h : array_field(obj, key)) {
    require_object(h, key);
    EventHandler handler;
    handler.event = optional_string(h, "event").value_or("");
    handler.target_page = optional_string(h, "targetPage");
    handler.target_flow = optional_string(h, "targetFlow");
    handler.has_trigger_fulfillment = has_fulfillment(h, "triggerFulfillment");
    handlers.push_back(std::move(handler));
  }
  return handlers;
}

std::vector<std::string> parse_route_group_refs(const json & obj)
{
  std::vector<std::string> refs;
  for (const auto & ref : array_field(obj, "transitionRouteGroups")) {
    if (!ref.is_string()) {
      throw MalformedField("field 'transitionRouteGroups' must contain strings");
    }
    refs.push_back(ref.get<std::string>());
  }
  return refs;
}

std::vector<FormParameter> parse_form(const json & page)
{
  std::vector<FormParameter> params;
  const json * form = object_field(page, "form");
  if (!form) return params;

  for (const auto & p : array_field(*form, "parameters")) {
    require_object(p, "form.parameters");
    FormParameter param;
    param.display_name = optional_string(p, "displayName").value_or("");
    if (const json * fb = object_field(p, "fillBehavior")) {
      param.has_initial_prompt = has_fulfillment(*fb, "initialPromptFulfillment");
      param.reprompt_event_handlers = parse_handlers(*fb, "repromptEventHandlers");
    }
    params.push_back(std::move(param));
  }
  return params;
}

// ----------------------------------------------------------------------------
// Documents
// ----------------------------------------------------------------------------

/// Thrown by read_document() / the resource parsers; carries the offending path.
struct DocumentFailure
{
  fs::path path;
  std::string message;
};

json read_document(const fs::path & path)
{
  std::ifstream in(path);
  if (!in.is_open()) {
    throw DocumentFailure{path, "cannot open file"};
  }
  json doc;
  try {
    doc = json::parse(in);
  } catch (const json::parse_error & e) {
    throw DocumentFailure{path, std::string("failed to parse JSON: ") + e.what()};
  }
  if (!doc.is_object()) {
    throw DocumentFailure{path, "document must be a JSON object"};
  }
  return doc;
}

template <typename Fn>
auto parse_document(const fs::path & path, Fn && fn)
{
  const json doc = read_document(path);
  try {
    return fn(doc);
  } catch (const MalformedField & e) {
    throw DocumentFailure{path, std::string("malformed document: ") + e.what()};
  } catch (const json::exception & e) {
    throw DocumentFailure{path, std::string("malformed document: ") + e.what()};
  }
}

Page load_page(const fs::path & path)
{
  return parse_document(path, [&](const json & doc) {
    Page page;
    page.id = optional_string(doc, "name").value_or(path.stem().string());
    page.display_name = optional_string(doc, "displayName").value_or(page.id);
    page.has_entry_action = has_entry_action(doc);
    page.form_parameters = parse_form(doc);
    page.transition_routes = parse_routes(doc);
    page.event_handlers = parse_handlers(doc, "eventHandlers");
    page.route_group_refs = parse_route_group_refs(doc);
    page.source_path = path;
    return page;
  });
}

RouteGroup load_route_group(const fs::path & path)
{
  return parse_document(path, [&](const json & doc) {
    RouteGroup group;
    group.id = optional_string(doc, "name").value_or(path.stem().string());
    group.display_name = optional_string(doc, "displayName").value_or(group.id);
    group.transition_routes = parse_routes(doc);
    group.source_path = path;
    return group;
  });
}

Flow load_flow_document(const fs::path & path, const std::string & dir_name)
{
  return parse_document(path, [&](const json & doc) {
    Flow flow;
    flow.id = optional_string(doc, "name").value_or(dir_name);
    flow.display_name = optional_string(doc, "displayName").value_or(flow.id);
    flow.transition_routes = parse_routes(doc);
    flow.event_handlers = parse_handlers(doc, "eventHandlers");
    flow.route_group_refs = parse_route_group_refs(doc);
    flow.source_path = path;
    return flow;
  });
}

// ----------------------------------------------------------------------------
// Directory walking
// ----------------------------------------------------------------------------

/// Sorted entries of `dir`; empty when `dir` does not exist.
std::vector<fs::path> sorted_entries(const fs::path & dir, bool want_directories)
{
  std::vector<fs::path> out;
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    return out;
  }

  fs::directory_iterator it(dir, ec);
  if (ec) {
    throw DocumentFailure{dir, "cannot list directory: " + ec.message()};
  }
  for (const auto & entry : it) {
    std::error_code type_ec;
    if (want_directories) {
      if (entry.is_directory(type_ec)) out.push_back(entry.path());
    } else if (entry.is_regular_file(type_ec) && entry.path().extension() == ".json") {
      out.push_back(entry.path());
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

}  // namespace

AgentLoadResult load_agent(const std::filesystem::path & root)
{
  std::error_code ec;
  if (!fs::exists(root, ec)) {
    return AgentLoadResult::fail(root, "agent directory not found");
  }
  if (!fs::is_directory(root, ec)) {
    return AgentLoadResult::fail(root, "not a directory");
  }

  AgentGraph graph;
  graph.set_root(root);

  try {
    for (const auto & flow_dir : sorted_entries(root / k_flows_dir_name, true)) {
      const std::string dir_name = flow_dir.filename().string();
      const fs::path flow_file = flow_dir / (dir_name + ".json");

      // A flow directory without its flow document contributes nothing.
      if (!fs::is_regular_file(flow_file, ec)) {
        continue;
      }

      Flow flow = load_flow_document(flow_file, dir_name);

      for (const auto & page_file : sorted_entries(flow_dir / k_pages_dir_name, false)) {
        flow.pages.push_back(load_page(page_file));
      }

      for (const auto & group_file : sorted_entries(flow_dir / k_route_groups_dir_name, false)) {
        flow.route_groups.push_back(load_route_group(group_file));
      }

      graph.add_flow(std::move(flow));
    }
  } catch (const DocumentFailure & failure) {
    return AgentLoadResult::fail(failure.path, failure.message);
  } catch (const fs::filesystem_error & e) {
    return AgentLoadResult::fail(e.path1().empty() ? root : e.path1(), e.what());
  }

  return AgentLoadResult::ok(std::move(graph));
}

}  // namespace flow_lint
