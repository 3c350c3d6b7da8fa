#include <catch2/catch_test_macros.hpp>
#include "AppException.hpp"
#include "PhotoCollection.hpp"
#include "TestHelpers.hpp"

#include <optional>
#include <string>

TEST_CASE("processing returns the worst status and sets the execution gate") {
    PhotoCollection collection(make_photos({"Beach", "Lake house"}));
    REQUIRE(collection.process_descriptions(NamingConfig{}) == PhotoStatus::Ready);
    REQUIRE_FALSE(collection.is_execution_blocked());

    NamingConfig config;
    config.over_length = OverlengthBehavior::Refuse;
    config.user_max_length = 12;
    REQUIRE(collection.process_descriptions(config) == PhotoStatus::RefuseLength);
    REQUIRE(collection.at(0).status() == PhotoStatus::Ready);
    REQUIRE(collection.at(1).description() == "Lake House - 01");
    REQUIRE(collection.is_execution_blocked());
}

TEST_CASE("warnings do not block execution") {
    NamingConfig config;
    config.user_max_length = 10;
    PhotoCollection collection(make_photos({"Sunset over the bay"}));
    REQUIRE(collection.process_descriptions(config) == PhotoStatus::WarningLength);
    REQUIRE_FALSE(collection.is_execution_blocked());
}

TEST_CASE("custom descriptions are validated against the batch") {
    const NamingConfig config;
    PhotoCollection collection(make_photos({"Beach", "Lake"}));
    collection.process_descriptions(config);
    REQUIRE(collection.at(0).description() == "Beach - 01");

    REQUIRE(collection.validate_custom_description(1, "beach - 01", config) == PhotoStatus::RefuseDuplicate);
    REQUIRE(collection.validate_custom_description(1, "Lake: sunset", config) == PhotoStatus::RefuseSymbol);
    REQUIRE(collection.validate_custom_description(1, "Short", config) == PhotoStatus::RefuseLength);
    REQUIRE(collection.validate_custom_description(1, "a:b", config) == PhotoStatus::RefuseSymbol);
    REQUIRE(collection.validate_custom_description(1, "Sunset over the lake", config) == PhotoStatus::Ready);
    REQUIRE(collection.validate_custom_description(1, std::string(255, 'x'), config) == PhotoStatus::RefuseLength);
}

TEST_CASE("duplicate detection folds accented letters") {
    const NamingConfig config;
    PhotoCollection collection(make_photos({"caf\xC3\xA9", "Lake"}));
    collection.process_descriptions(config);
    REQUIRE(collection.at(0).description() == "Caf\xC3\xA9 - 01");
    REQUIRE(collection.validate_custom_description(1, "CAF\xC3\x89 - 01", config) == PhotoStatus::RefuseDuplicate);
}

TEST_CASE("custom descriptions above the user limit follow the over-length policy") {
    NamingConfig config;
    config.user_max_length = 10;
    PhotoCollection collection(make_photos({"Beach", "Lake"}));

    config.over_length = OverlengthBehavior::Refuse;
    REQUIRE(collection.validate_custom_description(1, "Sunset over the lake", config) == PhotoStatus::RefuseLength);
    config.over_length = OverlengthBehavior::Truncate;
    REQUIRE(collection.validate_custom_description(1, "Sunset over the lake", config) == PhotoStatus::WarningLength);
    config.over_length = OverlengthBehavior::DoNothing;
    REQUIRE(collection.validate_custom_description(1, "Sunset over the lake", config) == PhotoStatus::Ready);
}

TEST_CASE("customized photos survive later passes until reverted") {
    const NamingConfig config;
    PhotoCollection collection(make_photos({"Beach", "Lake"}));
    collection.process_descriptions(config);

    REQUIRE(collection.apply_custom_description(1, "Lake: at dawn", config) == PhotoStatus::RefuseSymbol);
    REQUIRE(collection.at(1).is_customized());
    REQUIRE(collection.at(1).assigned_index() == -1);
    REQUIRE(collection.is_execution_blocked());

    REQUIRE(collection.process_descriptions(config) == PhotoStatus::RefuseSymbol);
    REQUIRE(collection.at(1).description() == "Lake: at dawn");

    REQUIRE(collection.apply_custom_description(1, "Lake at dawn", config) == PhotoStatus::Ready);
    REQUIRE_FALSE(collection.is_execution_blocked());

    REQUIRE(collection.revert_customization(1, config) == PhotoStatus::Ready);
    REQUIRE_FALSE(collection.at(1).is_customized());
    REQUIRE(collection.at(1).description() == "Lake - 01");
}

TEST_CASE("download outcomes update the gate") {
    PhotoCollection collection(make_photos({"Beach", "Lake"}));
    collection.process_descriptions(NamingConfig{});

    collection.set_photo_status(0, PhotoStatus::Saved);
    REQUIRE_FALSE(collection.is_execution_blocked());
    collection.set_photo_status(1, PhotoStatus::ErrorSevere);
    REQUIRE(collection.is_execution_blocked());

    collection.clear_all_statuses();
    REQUIRE_FALSE(collection.is_execution_blocked());
    REQUIRE(collection.at(1).status() == PhotoStatus::Ready);
}

TEST_CASE("the affixes listener sees each pass") {
    std::optional<SanitizedAffixes> seen;
    PhotoCollection collection(make_photos({"Beach"}));
    collection.set_affixes_listener([&seen](const SanitizedAffixes& affixes) { seen = affixes; });

    NamingConfig config;
    config.prefix = "Holiday: ";
    collection.process_descriptions(config);
    REQUIRE(seen.has_value());
    REQUIRE(seen->prefix == "Holiday- ");
    REQUIRE(collection.last_affixes().prefix == "Holiday- ");
    REQUIRE(collection.at(0).description() == "Holiday- Beach - 01");
}

TEST_CASE("rows outside the album raise an application error") {
    PhotoCollection collection(make_photos({"Beach"}));
    REQUIRE_THROWS_AS(collection.at(1), ErrorCodes::AppException);
    try {
        collection.set_photo_status(3, PhotoStatus::Saved);
        FAIL("expected an exception");
    } catch (const ErrorCodes::AppException& ex) {
        REQUIRE(ex.get_error_code() == ErrorCodes::Code::VALIDATION_VALUE_OUT_OF_RANGE);
    }
}
