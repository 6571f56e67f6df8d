#ifndef OPTIONS_TESTS_HPP
#define OPTIONS_TESTS_HPP
#include "../../src/uuidgen/options.hpp"
namespace tests
{
    class OptionsTests
    {
    public:
        constexpr static struct ParseFlags{} test_parse_flags{};
        constexpr static struct ParseErrors{} test_parse_errors{};
        constexpr static struct Validate{} test_validate{};
        constexpr static struct Dispatch{} test_dispatch{};
        constexpr static struct DispatchTimestamp{} test_dispatch_timestamp{};
        constexpr static struct Inspect{} test_inspect{};
        constexpr static struct Version{} test_version{};

        explicit OptionsTests(ParseFlags);
        explicit OptionsTests(ParseErrors);
        explicit OptionsTests(Validate);
        explicit OptionsTests(Dispatch);
        explicit OptionsTests(DispatchTimestamp);
        explicit OptionsTests(Inspect);
        explicit OptionsTests(Version);

        operator bool(){ return passed_; }
    private:
        bool passed_;
        uuidgen::Options options_;
    };
}
#endif
