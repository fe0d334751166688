#pragma once
#include <array>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <nlohmann/json.hpp>

/**
 * @brief The closed set of semantic roles.
 *
 * Roles are not hierarchical and never reinterpreted per project. Consumers switch
 * over all four cases without a default branch, so adding a role is a compile-visible change.
 */
enum class SemanticRole {
    Label,
    Container,
    Status,
    Priority
};

/**
 * @brief Fixed, compile-time set of all roles.
 */
inline constexpr std::array<SemanticRole, 4> kAllRoles = {
    SemanticRole::Label,
    SemanticRole::Container,
    SemanticRole::Status,
    SemanticRole::Priority
};

inline std::string roleToString(SemanticRole role) {
    switch (role) {
        case SemanticRole::Label: return "label";
        case SemanticRole::Container: return "container";
        case SemanticRole::Status: return "status";
        case SemanticRole::Priority: return "priority";
    }
    return "label";
}

inline std::optional<SemanticRole> roleFromString(const std::string& name) {
    for (SemanticRole role : kAllRoles) {
        if (roleToString(role) == name) return role;
    }
    return std::nullopt;
}

/**
 * @brief A named conceptual task attribute, independent of any tool.
 *
 * Identity is the id. The role is assigned once and never changes.
 */
struct SemanticEntity {
    std::string id;
    SemanticRole role = SemanticRole::Label;
    std::string description;

    nlohmann::json toJson() const;
    static SemanticEntity fromJson(const nlohmann::json& j);

    bool operator==(const SemanticEntity& other) const {
        return id == other.id && role == other.role && description == other.description;
    }
};

/**
 * @brief (tool, rawConceptId) pair used as key for default mappings and overrides.
 */
struct MappingKey {
    std::string tool;
    std::string rawConceptId;

    std::string toString() const { return tool + ":" + rawConceptId; }

    bool operator<(const MappingKey& other) const {
        return std::tie(tool, rawConceptId) < std::tie(other.tool, other.rawConceptId);
    }
    bool operator==(const MappingKey& other) const {
        return tool == other.tool && rawConceptId == other.rawConceptId;
    }
};

/**
 * @brief Value of a project override: an entity id or ExplicitNone.
 *
 * ExplicitNone differs from "absent": absent inherits the global default, ExplicitNone
 * means the concept is intentionally unmapped and never surfaces again for that project.
 */
struct MappingTarget {
    bool explicitNone = false;
    std::string entityId;

    static MappingTarget entity(const std::string& id) { return {false, id}; }
    static MappingTarget none() { return {true, ""}; }

    bool operator==(const MappingTarget& other) const {
        return explicitNone == other.explicitNone && entityId == other.entityId;
    }
    bool operator!=(const MappingTarget& other) const { return !(*this == other); }

    nlohmann::json toJson() const;
    static MappingTarget fromJson(const nlohmann::json& j);
};

/**
 * @brief Result of the two-level lookup, with provenance.
 */
struct Resolution {
    enum class Kind { Entity, ExplicitNone, Unmapped };
    enum class Source { ProjectOverride, GlobalDefault, None };

    Kind kind = Kind::Unmapped;
    Source source = Source::None;
    std::string entityId;
    std::string projectId;  // project whose override decided, when source == ProjectOverride

    bool isEntity() const { return kind == Kind::Entity; }
    bool isExplicitNone() const { return kind == Kind::ExplicitNone; }
    bool isUnmapped() const { return kind == Kind::Unmapped; }

    /** Human-readable form, e.g. "bug (override in project demo)". */
    std::string describe() const;
};

/**
 * @brief Raw concept as reported by a discovery plugin. Opaque beyond its id.
 */
struct RawToolEntity {
    std::string tool;
    std::string rawConceptId;
    std::string rawLabel;
    std::map<std::string, std::string> attributes;

    MappingKey key() const { return {tool, rawConceptId}; }

    bool operator<(const RawToolEntity& other) const { return key() < other.key(); }
    bool operator==(const RawToolEntity& other) const {
        return tool == other.tool && rawConceptId == other.rawConceptId &&
               rawLabel == other.rawLabel && attributes == other.attributes;
    }

    nlohmann::json toJson() const;
    static RawToolEntity fromJson(const nlohmann::json& j);
};
