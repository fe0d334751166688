#include "decision/DecisionCodec.h"
#include <filesystem>
#include <fstream>
#include "core/Errors.h"

namespace fs = std::filesystem;

namespace DecisionCodec {

    nlohmann::json encode(const std::vector<Proposal>& proposals) {
        nlohmann::json doc;
        doc["instructions"] =
            "Set each decision's outcome to accept (with entity_id), create_new (with entity "
            "{id, role, description}), ignore or defer. Optionally restrict with projects: [...]. "
            "Save and exit to apply; anything left as defer stays open.";
        nlohmann::json items = nlohmann::json::array();
        for (const auto& p : proposals) {
            nlohmann::json decision = {{"proposal_id", p.id}, {"outcome", "defer"}};
            if (p.suggestedEntityId) {
                decision["entity_id"] = *p.suggestedEntityId;
            }
            items.push_back({{"proposal", p.toJson()}, {"decision", decision}});
        }
        doc["items"] = items;
        return doc;
    }

    std::vector<Decision> decode(const nlohmann::json& doc) {
        if (!doc.is_object()) {
            throw DecisionFormatError("Decision document must be a JSON object");
        }
        std::vector<Decision> out;
        try {
            if (doc.contains("items")) {
                for (const auto& item : doc.at("items")) {
                    if (!item.contains("decision")) {
                        throw DecisionFormatError("Item without a decision");
                    }
                    out.push_back(Decision::fromJson(item.at("decision")));
                }
            } else if (doc.contains("decisions")) {
                for (const auto& d : doc.at("decisions")) {
                    out.push_back(Decision::fromJson(d));
                }
            } else {
                throw DecisionFormatError("Document has neither 'items' nor 'decisions'");
            }
        } catch (const nlohmann::json::exception& e) {
            throw DecisionFormatError(std::string("Malformed decision document: ") + e.what());
        } catch (const DecisionFormatError&) {
            throw;
        } catch (const UtsError& e) {
            throw DecisionFormatError(e.what());
        }
        return out;
    }

    std::vector<Decision> readFile(const std::string& path) {
        std::ifstream f(path);
        if (!f.is_open()) {
            throw DecisionFormatError("Cannot open decision document " + path);
        }
        nlohmann::json doc;
        try {
            f >> doc;
        } catch (const nlohmann::json::parse_error& e) {
            throw DecisionFormatError("Invalid JSON in " + path + ": " + e.what());
        }
        return decode(doc);
    }

    void writeFile(const std::string& path, const nlohmann::json& doc) {
        fs::path p(path);
        if (p.has_parent_path()) {
            std::error_code ec;
            fs::create_directories(p.parent_path(), ec);
            if (ec) {
                throw UtsError("Cannot create directory for decision document " + path + ": " + ec.message());
            }
        }
        std::ofstream f(path);
        if (!f.is_open()) {
            throw UtsError("Cannot write decision document " + path);
        }
        f << doc.dump(2) << std::endl;
    }
}
