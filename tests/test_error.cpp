#include <catch2/catch_test_macros.hpp>
#include <fieldsync/core/error.hpp>

using namespace fieldsync;

TEST_CASE("Error construction", "[error]") {
    SECTION("code and message") {
        Error e(Errc::Validation, "Progress must be between 0 and 100");
        REQUIRE(e.is_validation());
        REQUIRE(!e.is_forbidden());
        REQUIRE(e.errc() == Errc::Validation);
        REQUIRE(e.message() == "Progress must be between 0 and 100");
        REQUIRE(static_cast<bool>(e));
    }

    SECTION("default is success") {
        Error e;
        REQUIRE(e.errc() == Errc::Success);
        REQUIRE(!static_cast<bool>(e));
    }

    SECTION("std::error_code integration") {
        std::error_code ec = Errc::StaleWrite;
        REQUIRE(ec.category().name() == std::string("fieldsync"));
        REQUIRE(ec == Error::stale_write("moved").code());
    }
}

TEST_CASE("Error factory methods", "[error]") {
    REQUIRE(Error::forbidden("no").is_forbidden());
    REQUIRE(Error::validation("bad").is_validation());
    REQUIRE(Error::not_found("gone").is_not_found());
    REQUIRE(Error::stale_write("moved").is_stale_write());
    REQUIRE(Error::persistence("disk").errc() == Errc::Persistence);
    REQUIRE(Error::internal("boom").errc() == Errc::Internal);
}

TEST_CASE("Invalid state errors carry the allowed targets", "[error]") {
    SECTION("non-terminal state") {
        auto e = Error::invalid_state(TaskStatus::Planned, TaskStatus::Completed);
        REQUIRE(e.is_invalid_state());
        REQUIRE(e.current_status() == TaskStatus::Planned);
        REQUIRE(e.allowed_targets() ==
                std::vector<TaskStatus>{TaskStatus::InProgress, TaskStatus::Cancelled});
    }

    SECTION("terminal state") {
        auto e = Error::invalid_state(TaskStatus::Completed, TaskStatus::InProgress);
        REQUIRE(e.allowed_targets().empty());
    }

    SECTION("to_string lists current and allowed") {
        auto s = Error::invalid_state(TaskStatus::Paused, TaskStatus::Completed).to_string();
        REQUIRE(s.find("INVALID_STATE") != std::string::npos);
        REQUIRE(s.find("current: PAUSED") != std::string::npos);
        REQUIRE(s.find("allowed: [IN_PROGRESS, CANCELLED]") != std::string::npos);
    }
}

TEST_CASE("Error status mapping", "[error]") {
    REQUIRE(Error(Errc::InvalidState).status() == 409);
    REQUIRE(Error(Errc::Forbidden).status() == 403);
    REQUIRE(Error(Errc::Validation).status() == 400);
    REQUIRE(Error(Errc::NotFound).status() == 404);
    REQUIRE(Error(Errc::StaleWrite).status() == 409);
    REQUIRE(Error(Errc::Persistence).status() == 500);
    REQUIRE(Error(Errc::Internal).status() == 500);
}
