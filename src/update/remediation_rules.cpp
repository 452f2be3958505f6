#include "update/remediation_rules.hpp"

#include "update/builder_adapter.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <memory>
#include <sstream>

namespace genup {

namespace {

using nlohmann::json;

std::string Hint(const BuildError& failure, const char* key) {
    auto it = failure.hints.find(key);
    return it == failure.hints.end() ? std::string() : it->second;
}

class MissingDependencyRule final : public RemediationEngine::IRule {
public:
    const char* Name() const override { return kFailureMissingDependency; }

    bool Matches(const BuildError& failure) const override {
        return failure.failure_class == kFailureMissingDependency;
    }

    std::optional<Revision> Apply(const Revision& revision, const BuildError& failure) const override {
        const std::string dep = Hint(failure, "dependency");
        if (dep.empty() || !revision.payload.is_object())
            return std::nullopt;

        json payload = revision.payload;
        json& deps = payload["dependencies"];
        if (deps.is_null())
            deps = json::array();
        if (!deps.is_array())
            return std::nullopt;
        if (std::find(deps.begin(), deps.end(), json(dep)) != deps.end())
            return std::nullopt;  // already declared; the failure has another cause
        deps.push_back(dep);

        std::vector<std::string> components = revision.components;
        components.push_back(dep);
        return DeriveRevision(revision, std::move(components), std::move(payload), Name());
    }
};

// Returns the number of replaced string values.
int ReplaceStringValues(json& node, const std::string& from, const std::string& to) {
    int n = 0;
    if (node.is_string()) {
        if (node.get_ref<const std::string&>() == from) {
            node = to;
            ++n;
        }
    } else if (node.is_structured()) {
        for (auto& child : node)
            n += ReplaceStringValues(child, from, to);
    }
    return n;
}

class HashMismatchRule final : public RemediationEngine::IRule {
public:
    const char* Name() const override { return kFailureHashMismatch; }

    bool Matches(const BuildError& failure) const override {
        return failure.failure_class == kFailureHashMismatch;
    }

    std::optional<Revision> Apply(const Revision& revision, const BuildError& failure) const override {
        const std::string specified = Hint(failure, "specified");
        const std::string got = Hint(failure, "got");
        if (specified.empty() || got.empty() || specified == got)
            return std::nullopt;

        json payload = revision.payload;
        if (ReplaceStringValues(payload, specified, got) == 0)
            return std::nullopt;
        return DeriveRevision(revision, revision.components, std::move(payload), Name());
    }
};

class NoSpaceRule final : public RemediationEngine::IRule {
public:
    const char* Name() const override { return kFailureNoSpace; }

    bool Matches(const BuildError& failure) const override {
        return failure.failure_class == kFailureNoSpace;
    }

    std::optional<Revision> Apply(const Revision& revision, const BuildError&) const override {
        if (!revision.payload.is_object())
            return std::nullopt;

        json payload = revision.payload;
        json& build = payload["build"];
        if (build.is_null())
            build = json::object();
        if (!build.is_object())
            return std::nullopt;
        auto it = build.find("collect_garbage");
        if (it != build.end() && it->is_boolean() && it->get<bool>())
            return std::nullopt;  // already collecting; nothing left to free
        build["collect_garbage"] = true;
        return DeriveRevision(revision, revision.components, std::move(payload), Name());
    }
};

std::vector<std::string> SplitDotted(const std::string& path) {
    std::vector<std::string> parts;
    std::stringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '.')) {
        if (!part.empty())
            parts.push_back(part);
    }
    return parts;
}

class ObsoleteOptionRule final : public RemediationEngine::IRule {
public:
    const char* Name() const override { return kFailureObsoleteOption; }

    bool Matches(const BuildError& failure) const override {
        return failure.failure_class == kFailureObsoleteOption;
    }

    // Accepts both spellings: a flat "a.b.c" key and nested objects a -> b -> c.
    std::optional<Revision> Apply(const Revision& revision, const BuildError& failure) const override {
        const std::string option = Hint(failure, "option");
        if (option.empty() || !revision.payload.is_object())
            return std::nullopt;
        auto opts_it = revision.payload.find("options");
        if (opts_it == revision.payload.end() || !opts_it->is_object())
            return std::nullopt;

        json payload = revision.payload;
        json& options = payload["options"];
        bool removed = options.erase(option) > 0;

        if (!removed) {
            const auto parts = SplitDotted(option);
            if (parts.empty())
                return std::nullopt;
            json* node = &options;
            for (size_t i = 0; i + 1 < parts.size() && node; ++i) {
                auto it = node->find(parts[i]);
                node = (it != node->end() && it->is_object()) ? &*it : nullptr;
            }
            if (node)
                removed = node->erase(parts.back()) > 0;
        }
        if (!removed)
            return std::nullopt;
        return DeriveRevision(revision, revision.components, std::move(payload), Name());
    }
};

} // namespace

std::vector<RemediationEngine::RulePtr> CreateDefaultRemediationRules() {
    std::vector<RemediationEngine::RulePtr> rules;
    rules.push_back(std::make_shared<MissingDependencyRule>());
    rules.push_back(std::make_shared<HashMismatchRule>());
    rules.push_back(std::make_shared<NoSpaceRule>());
    rules.push_back(std::make_shared<ObsoleteOptionRule>());
    return rules;
}

std::expected<std::vector<RemediationEngine::RulePtr>, std::string>
SelectRemediationRules(const std::vector<std::string>& names) {
    const auto all = CreateDefaultRemediationRules();
    std::vector<RemediationEngine::RulePtr> out;
    for (const auto& name : names) {
        bool found = false;
        for (const auto& rule : all) {
            if (name == rule->Name()) {
                out.push_back(rule);
                found = true;
                break;
            }
        }
        if (!found)
            return std::unexpected("unknown remediation rule: " + name);
    }
    return out;
}

} // namespace genup
