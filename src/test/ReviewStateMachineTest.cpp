#include <cassert>
#include <iostream>
#include <memory>

#include "TestSupport.hpp"
#include "application/CellMaterializer.hpp"
#include "application/ReviewService.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/InMemoryCellRepository.hpp"

using json = nlohmann::json;
using namespace lextable::domain;
using namespace lextable::domain::review;
using namespace lextable::application;

static ReviewAction Action(std::optional<ReviewState> state, std::optional<std::string> value, int version,
                           const std::string& actor = "alice") {
    ReviewAction action;
    action.reviewState = state;
    action.manualValue = value;
    action.actor = actor;
    action.expectedVersion = version;
    return action;
}

static bool RejectedAsInvalid(ReviewService& service, const std::string& cellId, const ReviewAction& action) {
    try {
        service.review(cellId, action);
    } catch (const ValidationError&) {
        return true;
    }
    return false;
}

int main() {
    std::cout << "[Test] Starting Review State Machine Test..." << std::endl;

    auto field = lextable::test::FieldFromJson({
        {"key", "effective_date_term"},
        {"patterns", json::array({
            {{"regex", "effective as of (\\w+ \\d{1,2}, \\d{4})"}, {"priority", 10}, {"group", 1}}
        })}
    });
    auto doc = lextable::test::Segmented(lextable::test::TextDocument("doc-a", "a.txt", {
        "This Agreement is effective as of January 1, 2023 and expires December 31, 2025."
    }));

    CellMaterializer materializer;
    auto repo = std::make_shared<lextable::infrastructure::InMemoryCellRepository>();
    ReviewService service(repo);

    Cell cell = materializer.materialize("job-1", doc, field, lextable::domain::extraction::Extractor{}.extract(doc, field));
    assert(cell.state() == ReviewState::Extracted);
    assert(cell.version() == 1);
    assert(cell.record().value == std::optional<std::string>("January 1, 2023"));
    assert(cell.record().valueRaw == cell.record().value);
    assert(cell.getUncommittedEntries().size() == 1);
    assert(cell.getUncommittedEntries()[0].action == AuditAction::Created);
    repo->save(cell);
    assert(cell.getUncommittedEntries().empty());
    const std::string id = cell.id();
    std::cout << "[PASS] Materialized cell starts EXTRACTED at version 1 with a CREATED entry." << std::endl;

    // Scenario D: manual edit keeps value_raw
    ReviewAction edit = Action(std::nullopt, std::string("Jan 1 2023"), 1);
    edit.reason = "reviewer shorthand";
    CellRecord edited = service.review(id, edit);
    assert(edited.reviewState == ReviewState::ManualUpdated);
    assert(edited.value == std::optional<std::string>("Jan 1 2023"));
    assert(edited.valueRaw == std::optional<std::string>("January 1, 2023"));
    assert(edited.citation.has_value() && "Citation is untouched by a manual edit.");
    assert(edited.version == 2);

    auto log = service.auditLog(id);
    assert(log.size() == 2);
    assert(log[1].sequence == 2);
    assert(log[1].action == AuditAction::ManualEdit);
    assert(log[1].before->value == std::optional<std::string>("January 1, 2023"));
    assert(log[1].before->reviewState == ReviewState::Extracted);
    assert(log[1].after.value == std::optional<std::string>("Jan 1 2023"));
    assert(log[1].reason == std::optional<std::string>("reviewer shorthand"));
    assert(log[1].actor == "alice");
    std::cout << "[PASS] Manual edit sets value and records before/after." << std::endl;

    // Confirm then reject from any reviewed state
    CellRecord confirmed = service.review(id, Action(ReviewState::Confirmed, std::nullopt, 2));
    assert(confirmed.reviewState == ReviewState::Confirmed);
    assert(confirmed.value == std::optional<std::string>("Jan 1 2023"));
    CellRecord rejected = service.review(id, Action(ReviewState::Rejected, std::nullopt, 3, "bob"));
    assert(rejected.reviewState == ReviewState::Rejected);
    assert(rejected.version == 4);
    std::cout << "[PASS] Confirm and reject transitions." << std::endl;

    // Invalid actions change nothing
    assert(RejectedAsInvalid(service, id, Action(ReviewState::Extracted, std::nullopt, 4)));
    assert(RejectedAsInvalid(service, id, Action(ReviewState::MissingData, std::nullopt, 4)));
    assert(RejectedAsInvalid(service, id, Action(ReviewState::ManualUpdated, std::nullopt, 4)));
    assert(RejectedAsInvalid(service, id, Action(ReviewState::Confirmed, std::string("x"), 4)));
    assert(RejectedAsInvalid(service, id, Action(std::nullopt, std::nullopt, 4)));
    assert(RejectedAsInvalid(service, id, Action(ReviewState::Confirmed, std::nullopt, 4, "")));
    assert(RejectedAsInvalid(service, id, Action(ReviewState::Confirmed, std::nullopt, 0)));
    assert(service.auditLog(id).size() == 4);
    assert(service.cell(id).version == 4);
    std::cout << "[PASS] Invalid actions raise ValidationError without side effects." << std::endl;

    // Unknown cell
    bool notFound = false;
    try {
        service.review("ffffffffffffffff", Action(ReviewState::Confirmed, std::nullopt, 1));
    } catch (const NotFoundError&) {
        notFound = true;
    }
    assert(notFound);

    // MISSING_DATA cells can be confirmed or edited
    auto missingField = lextable::test::FieldFromJson({
        {"key", "arbitration"}, {"patterns", json::array({{{"regex", "arbitration"}, {"priority", 1}}})}
    });
    Cell missing = materializer.materialize("job-1", doc, missingField,
                                            lextable::domain::extraction::Extractor{}.extract(doc, missingField));
    assert(missing.state() == ReviewState::MissingData);
    assert(missing.record().confidence == 0.0);
    assert(!missing.record().citation);
    repo->save(missing);
    CellRecord filled = service.review(missing.id(), Action(std::nullopt, std::string("JAMS, New York"), 1));
    assert(filled.reviewState == ReviewState::ManualUpdated);
    assert(!filled.valueRaw);
    std::cout << "[PASS] MISSING_DATA cells accept manual values." << std::endl;

    // Audit integrity: strictly increasing sequences, chained snapshots
    auto full = service.auditLog(id);
    for (std::size_t i = 1; i < full.size(); ++i) {
        assert(full[i].sequence == full[i - 1].sequence + 1);
        assert(full[i].before.has_value());
        assert(full[i].before->reviewState == full[i - 1].after.reviewState);
        assert(full[i].before->value == full[i - 1].after.value);
    }
    std::cout << "[PASS] Audit log is gap-free and chained." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
