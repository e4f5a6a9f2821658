#include "core/Error.hpp"

#include <doctest/doctest.h>

#include <vector>

using namespace TP;

TEST_SUITE("core.error") {
    TEST_CASE("Error string helpers") {
        // Touch every enum value using a runtime loop so the compiler cannot
        // constant-fold the switch.
        std::vector<Error::Code> codes;
        for (int i = static_cast<int>(Error::Code::InvalidError); i <= static_cast<int>(Error::Code::WriteFailed); ++i) {
            codes.push_back(static_cast<Error::Code>(i));
        }

        for (auto code : codes) {
            auto label = errorCodeToString(code);
            CHECK_FALSE(label.empty());
            // describeError should echo the label when message is absent.
            Error e{code, {}};
            CHECK(describeError(e) == std::string{label});
        }

        Error withMsg{Error::Code::UnknownKey, "bad"};
        CHECK(describeError(withMsg) == "unknown_key:bad");

        auto unknownLabel = errorCodeToString(static_cast<Error::Code>(999));
        CHECK(unknownLabel == "unknown_error");
        Error synthetic{static_cast<Error::Code>(999), {}};
        CHECK(describeError(synthetic) == "unknown_error");
    }

    TEST_CASE("Error kinds group the codes") {
        CHECK(errorKind(Error::Code::MissingField) == ErrorKind::Structural);
        CHECK(errorKind(Error::Code::UnknownKey) == ErrorKind::Structural);
        CHECK(errorKind(Error::Code::ConflictingFields) == ErrorKind::Semantic);
        CHECK(errorKind(Error::Code::ColorOutOfRange) == ErrorKind::Semantic);
        CHECK(errorKind(Error::Code::VersionTooLow) == ErrorKind::Semantic);
        CHECK(errorKind(Error::Code::ResourceNotFound) == ErrorKind::Resource);
        CHECK(errorKind(Error::Code::WriteFailed) == ErrorKind::Resource);
        CHECK(errorKind(Error::Code::UnknownError) == ErrorKind::Internal);
    }

    TEST_CASE("makeError prefixes the field") {
        auto error = makeError(Error::Code::OutOfBounds, "patches[1].cell", "outside the grid");
        CHECK(error.code == Error::Code::OutOfBounds);
        CHECK(error.message.value() == "patches[1].cell: outside the grid");

        CHECK(makeError(Error::Code::MalformedInput, "", "not JSON").message.value() == "not JSON");
        CHECK(makeError(Error::Code::MissingField, "depth", "").message.value() == "depth");
    }
}
