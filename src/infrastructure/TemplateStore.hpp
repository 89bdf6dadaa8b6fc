/**
 * @file TemplateStore.hpp
 * @brief Loads, validates and compiles an extraction template.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "domain/FieldTemplate.hpp"

namespace lextable::infrastructure {

/**
 * @class TemplateStore
 * @brief Immutable, validated field template for the lifetime of a run.
 *
 * Every pattern is compiled once here. Any problem raises
 * domain::TemplateError before a job can start.
 */
class TemplateStore {
public:
    /** @throws domain::TemplateError */
    static std::shared_ptr<const TemplateStore> Load(const std::string& path);

    /** @throws domain::TemplateError */
    static std::shared_ptr<const TemplateStore> FromJson(const nlohmann::json& payload, const std::string& origin = "<memory>");

    const std::string& templateId() const { return m_templateId; }
    const std::string& description() const { return m_description; }
    const std::string& origin() const { return m_origin; }

    /** @brief Fields in declaration order. */
    const std::vector<domain::FieldDefinition>& fields() const { return m_fields; }

    const domain::FieldDefinition* findField(const std::string& key) const;

private:
    TemplateStore() = default;

    static domain::FieldDefinition ParseField(const nlohmann::json& raw, std::size_t index);
    static domain::PatternRule ParseRule(const nlohmann::json& raw, const std::string& fieldKey, std::size_t index);

    std::string m_templateId;
    std::string m_description;
    std::string m_origin;
    std::vector<domain::FieldDefinition> m_fields;
};

} // namespace lextable::infrastructure
