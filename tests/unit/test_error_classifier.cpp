/**
 * @file test_error_classifier.cpp
 * @brief Юнит-тесты классификации ошибок
 */

#include <doctest/doctest.h>
#include "core/error_classifier.hpp"

using namespace strata::core;
using namespace strata::model;

TEST_CASE("fatal messages abort and block saving") {
    ErrorClassifier classifier;

    for (const char* message : {
             "File is corrupt: XML error in workbook",
             "Cannot read file: /tmp/x.xlsx",
             "Unsupported file type: boring.docx",
             "No depth values found in sheet 'Log'",
             "Could not identify depth column in the spreadsheet",
             "No text content found in PDF (may be image-based)"}) {
        CAPTURE(message);
        const auto c = classifier.classifyError(message);
        CHECK(c.type == ErrorSeverity::Fatal);
        CHECK(c.should_abort);
        CHECK_FALSE(c.allow_save);
        CHECK_FALSE(c.force_review);
        CHECK(c.confidence_impact == doctest::Approx(1.0));
    }
}

TEST_CASE("recoverable messages force review") {
    ErrorClassifier classifier;

    const auto inverted = classifier.classifyError("Layer \"Clay\": start depth (10) > end depth (5)");
    CHECK(inverted.type == ErrorSeverity::Recoverable);
    CHECK(inverted.force_review);
    CHECK_FALSE(inverted.should_abort);
    CHECK_FALSE(inverted.allow_save);
    CHECK(inverted.confidence_impact == doctest::Approx(0.3));

    const auto duplicate = classifier.classifyError("Found 2 duplicate depth values");
    CHECK(duplicate.type == ErrorSeverity::Recoverable);
    CHECK(duplicate.allow_save);

    const auto material = classifier.classifyError("Could not identify strata/material column in the spreadsheet");
    CHECK(material.type == ErrorSeverity::Recoverable);

    const auto non_numeric = classifier.classifyError("Found 3 non-numeric depth values");
    CHECK(non_numeric.type == ErrorSeverity::Recoverable);
}

TEST_CASE("unmatched messages are warnings, empty message is fatal") {
    ErrorClassifier classifier;

    const auto warning = classifier.classifyError("Gap of 2 between layers");
    CHECK(warning.type == ErrorSeverity::Warning);
    CHECK(warning.allow_save);
    CHECK_FALSE(warning.force_review);
    CHECK(warning.confidence_impact == doctest::Approx(0.05));

    const auto empty = classifier.classifyError("   ");
    CHECK(empty.type == ErrorSeverity::Fatal);
    CHECK(empty.message == "Unknown error");
}

TEST_CASE("classification is deterministic and case-insensitive") {
    ErrorClassifier classifier;
    const std::string message = "INVALID FILE FORMAT: not a ZIP archive";

    const auto first = classifier.classifyError(message);
    const auto second = classifier.classifyError(message);
    CHECK(first == second);
    CHECK(first.type == ErrorSeverity::Fatal);
    CHECK(first.message == message);
}

TEST_CASE("typed errors use their code category") {
    ErrorClassifier classifier;

    CHECK(classifier.classify({ErrorCode::Cancelled, "anything"}).type == ErrorSeverity::Fatal);
    CHECK(classifier.classify({ErrorCode::UnitAssumed, "No unit specified"}).type == ErrorSeverity::Warning);

    const auto overlap = classifier.classify({ErrorCode::LayerOverlap, "Layers overlap"});
    CHECK(overlap.type == ErrorSeverity::Recoverable);
    CHECK_FALSE(overlap.allow_save);

    const auto partial = classifier.classify({ErrorCode::PartialExtraction, "Some rows skipped"});
    CHECK(partial.type == ErrorSeverity::Recoverable);
    CHECK(partial.allow_save);

    // Текст без кода классифицируется по правилам
    const auto unclassified = classifier.classify({ErrorCode::Unclassified, "file is corrupted"});
    CHECK(unclassified.type == ErrorSeverity::Fatal);
}

TEST_CASE("classifyErrors aggregates flags and caps impact") {
    ErrorClassifier classifier;

    const auto recoverable = classifier.classifyErrors(ErrorList{
        {ErrorCode::DuplicateDepth, "Found 1 duplicate depth values"},
        {ErrorCode::LayerGap, "Gap of 3 between layers"}
    });
    CHECK(recoverable.overall_type == ErrorSeverity::Recoverable);
    CHECK(recoverable.force_review);
    CHECK(recoverable.allow_save);
    CHECK_FALSE(recoverable.should_abort);
    CHECK(recoverable.recoverable_count == 1);
    CHECK(recoverable.warning_count == 1);
    CHECK(recoverable.total_confidence_impact == doctest::Approx(0.35));

    const auto fatal = classifier.classifyErrors(std::vector<std::string>{
        "Found 1 duplicate depth values",
        "Unsupported file type: a.doc",
        "File is corrupt"
    });
    CHECK(fatal.overall_type == ErrorSeverity::Fatal);
    CHECK(fatal.should_abort);
    CHECK_FALSE(fatal.allow_save);
    CHECK_FALSE(fatal.force_review);
    CHECK(fatal.fatal_count == 2);
    CHECK(fatal.total() == 3);
    CHECK(fatal.total_confidence_impact == doctest::Approx(1.0));

    const auto none = classifier.classifyErrors(ErrorList{});
    CHECK_FALSE(none.overall_type.has_value());
    CHECK(none.allow_save);
    CHECK(none.total() == 0);
}

TEST_CASE("createErrorReport follows the worst category") {
    ErrorClassifier classifier;

    const auto clean = classifier.createErrorReport(classifier.classifyErrors(ErrorList{}));
    CHECK(clean.title == "Extraction Complete");
    CHECK(clean.actions == std::vector<std::string>{"Save", "Review Data"});

    const auto failed = classifier.createErrorReport(
        classifier.classifyErrors(std::vector<std::string>{"File is corrupt"}));
    CHECK(failed.title == "Extraction Failed");
    CHECK(failed.actions == std::vector<std::string>{"Close", "Try Different File"});

    const auto review = classifier.createErrorReport(
        classifier.classifyErrors(std::vector<std::string>{"Layers \"Clay\" and \"Sand\" overlap"}));
    CHECK(review.title == "Review Required");

    const auto warnings = classifier.createErrorReport(
        classifier.classifyErrors(std::vector<std::string>{"Something minor"}));
    CHECK(warnings.title == "Extraction Complete with Warnings");
    CHECK(warnings.actions.size() == 3);
}
