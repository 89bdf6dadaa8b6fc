/**
 * @file TemplateStore.cpp
 * @brief Implementation of TemplateStore.
 */

#include "infrastructure/TemplateStore.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <regex>
#include <set>

#include "domain/Errors.hpp"

namespace lextable::infrastructure {

using json = nlohmann::json;
using namespace lextable::domain;

namespace {

std::string RequireString(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || !j[key].is_string() || j[key].get<std::string>().empty()) {
        throw TemplateError(where + ": '" + key + "' must be a non-empty string");
    }
    return j[key].get<std::string>();
}

} // namespace

std::shared_ptr<const TemplateStore> TemplateStore::Load(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw TemplateError("file not found: " + path);
    }

    json payload;
    try {
        std::ifstream f(path);
        f >> payload;
    } catch (const json::exception& e) {
        throw TemplateError(path + ": malformed JSON: " + e.what());
    }

    auto store = FromJson(payload, path);
    std::cout << "[TemplateStore] Loaded '" << store->templateId() << "' with "
              << store->fields().size() << " fields from " << path << std::endl;
    return store;
}

std::shared_ptr<const TemplateStore> TemplateStore::FromJson(const json& payload, const std::string& origin) {
    if (!payload.is_object()) {
        throw TemplateError(origin + ": template must be a JSON object");
    }
    if (!payload.contains("fields") || !payload["fields"].is_array() || payload["fields"].empty()) {
        throw TemplateError(origin + ": 'fields' must be a non-empty array");
    }

    // Private constructor, so no make_shared.
    std::shared_ptr<TemplateStore> store(new TemplateStore());
    store->m_origin = origin;
    store->m_templateId = payload.contains("template_id") && payload["template_id"].is_string()
                              ? payload["template_id"].get<std::string>()
                              : std::filesystem::path(origin).stem().string();
    store->m_description = payload.contains("description") && payload["description"].is_string()
                               ? payload["description"].get<std::string>() : "";

    try {
        std::set<std::string> keys;
        std::size_t index = 0;
        for (const auto& raw : payload["fields"]) {
            FieldDefinition field = ParseField(raw, index++);
            if (!keys.insert(field.key).second) {
                throw TemplateError("duplicate field key '" + field.key + "'");
            }
            store->m_fields.push_back(std::move(field));
        }
    } catch (const json::exception& e) {
        throw TemplateError(origin + ": " + e.what());
    }
    return store;
}

FieldDefinition TemplateStore::ParseField(const json& raw, std::size_t index) {
    const std::string where = "field #" + std::to_string(index + 1);
    if (!raw.is_object()) {
        throw TemplateError(where + ": must be an object");
    }

    FieldDefinition field;
    field.key = RequireString(raw, "key", where);
    field.label = raw.contains("label") && raw["label"].is_string() ? raw["label"].get<std::string>() : field.key;
    field.description = raw.contains("description") && raw["description"].is_string()
                            ? raw["description"].get<std::string>() : "";

    const std::string typeName = raw.contains("type") && raw["type"].is_string() ? raw["type"].get<std::string>() : "text";
    auto type = FieldTypeFromString(typeName);
    if (!type) {
        throw TemplateError("field '" + field.key + "': unknown type '" + typeName + "'");
    }
    field.type = *type;

    if (!raw.contains("patterns") || !raw["patterns"].is_array() || raw["patterns"].empty()) {
        throw TemplateError("field '" + field.key + "': 'patterns' must be a non-empty array");
    }

    std::set<int> priorities;
    std::size_t ruleIndex = 0;
    for (const auto& rawRule : raw["patterns"]) {
        PatternRule rule = ParseRule(rawRule, field.key, ruleIndex++);
        if (!priorities.insert(rule.priority).second) {
            throw TemplateError("field '" + field.key + "': duplicate priority " + std::to_string(rule.priority));
        }
        field.rules.push_back(std::move(rule));
    }
    field.sortRules();
    return field;
}

PatternRule TemplateStore::ParseRule(const json& raw, const std::string& fieldKey, std::size_t index) {
    const std::string where = "field '" + fieldKey + "' pattern #" + std::to_string(index + 1);
    if (!raw.is_object()) {
        throw TemplateError(where + ": must be an object");
    }

    PatternRule rule;
    rule.declarationIndex = index;
    rule.source = RequireString(raw, "regex", where);

    if (!raw.contains("priority") || !raw["priority"].is_number_integer()) {
        throw TemplateError(where + ": 'priority' must be an integer");
    }
    rule.priority = raw["priority"].get<int>();

    try {
        rule.matcher = std::regex(rule.source, std::regex::ECMAScript | std::regex::icase);
    } catch (const std::regex_error& e) {
        throw TemplateError(where + ": regex does not compile: " + e.what());
    }

    if (raw.contains("group")) {
        if (!raw["group"].is_number_integer() || raw["group"].get<long long>() < 0) {
            throw TemplateError(where + ": 'group' must be a non-negative integer");
        }
        rule.group = raw["group"].get<std::size_t>();
    }
    if (rule.group > rule.matcher.mark_count()) {
        throw TemplateError(where + ": group " + std::to_string(rule.group) + " exceeds the " +
                            std::to_string(rule.matcher.mark_count()) + " capture groups of the regex");
    }

    if (raw.contains("normalizer") && !raw["normalizer"].is_null()) {
        const std::string name = raw["normalizer"].is_string() ? raw["normalizer"].get<std::string>() : "";
        auto id = NormalizerIdFromString(name);
        if (!id) {
            throw TemplateError(where + ": unknown normalizer '" + name + "'");
        }
        rule.normalizer = *id;
    }
    return rule;
}

const FieldDefinition* TemplateStore::findField(const std::string& key) const {
    for (const auto& field : m_fields) {
        if (field.key == key) return &field;
    }
    return nullptr;
}

} // namespace lextable::infrastructure
