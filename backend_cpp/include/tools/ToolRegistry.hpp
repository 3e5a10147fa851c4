#pragma once
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace concierge {

struct ToolMetadata {
    std::string name;
    std::string description;
    std::string parameter_schema; // JSON schema text shown to the model
};

// Tools report failures as "ERROR: ..." observations so the model can adapt.
class ITool {
public:
    virtual ~ITool() = default;
    virtual ToolMetadata get_metadata() = 0;
    virtual std::string execute(const std::string& args_json) = 0;
};

// Wraps a callable; handy for one-off tools and tests.
class GenericTool : public ITool {
public:
    using Action = std::function<std::string(const std::string&)>;

    GenericTool(std::string name, std::string description, std::string schema, Action action)
        : meta_{std::move(name), std::move(description), std::move(schema)}, action_(std::move(action)) {}

    ToolMetadata get_metadata() override { return meta_; }
    std::string execute(const std::string& args_json) override { return action_(args_json); }

private:
    ToolMetadata meta_;
    Action action_;
};

// The tools one agent may call, by name. Owned by that agent; not shared.
class ToolRegistry {
public:
    void register_tool(std::unique_ptr<ITool> tool) {
        const std::string name = tool->get_metadata().name;
        if (tools_.count(name)) spdlog::warn("⚠️ Tool {} registered twice; keeping the newer one", name);
        tools_[name] = std::move(tool);
        spdlog::debug("Tool registered: {}", name);
    }

    bool has_tool(const std::string& name) const { return tools_.count(name) > 0; }
    size_t size() const { return tools_.size(); }

    std::vector<std::string> names() const {
        std::vector<std::string> out;
        for (const auto& entry : tools_) out.push_back(entry.first);
        return out;
    }

    nlohmann::json get_manifest_json() const {
        auto manifest = nlohmann::json::array();
        for (const auto& entry : tools_) {
            auto meta = entry.second->get_metadata();
            manifest.push_back({
                {"name", meta.name},
                {"description", meta.description},
                {"parameters", meta.parameter_schema}
            });
        }
        return manifest;
    }

    // Text block for the agent prompt.
    std::string get_manifest() const { return get_manifest_json().dump(2); }

    // Never throws: unknown tools, bad arguments and tool exceptions all come
    // back as ERROR observations.
    std::string dispatch(const std::string& name, const nlohmann::json& args) {
        auto found = tools_.find(name);
        if (found == tools_.end()) {
            return "ERROR: Tool '" + name + "' not found.";
        }
        if (!args.is_object()) {
            return "ERROR: Tool '" + name + "' expects a JSON object of parameters.";
        }

        const auto started = std::chrono::steady_clock::now();
        std::string observation;
        try {
            observation = found->second->execute(args.dump());
        } catch (const std::exception& e) {
            spdlog::warn("⚠️ Tool {} threw: {}", name, e.what());
            observation = "ERROR: Tool '" + name + "' failed: " + e.what();
        }
        const double elapsed_ms =
            std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
        spdlog::info("🔧 Tool {} finished in {:.1f} ms ({} bytes)", name, elapsed_ms, observation.size());
        return observation;
    }

private:
    std::map<std::string, std::unique_ptr<ITool>> tools_;
};

} // namespace concierge
