#include "options/options-tests.hpp"
#include <iostream>
#include <cstdlib>

int main(int argc, char* argv[]){
    int failures = 0;
    {
        // Command line tests.
        using namespace tests;
        std::size_t test_num = 1;
        auto report = [&](bool passed){
            if(passed){
                std::cout << "Options test " << test_num << " passed." << std::endl;
            } else {
                std::cerr << "Options test " << test_num << " failed." << std::endl;
                ++failures;
            }
            ++test_num;
        };
        {
            OptionsTests test_parse_flags(OptionsTests::test_parse_flags);
            report(test_parse_flags);
        }
        {
            OptionsTests test_parse_errors(OptionsTests::test_parse_errors);
            report(test_parse_errors);
        }
        {
            OptionsTests test_validate(OptionsTests::test_validate);
            report(test_validate);
        }
        {
            OptionsTests test_dispatch(OptionsTests::test_dispatch);
            report(test_dispatch);
        }
        {
            OptionsTests test_dispatch_timestamp(OptionsTests::test_dispatch_timestamp);
            report(test_dispatch_timestamp);
        }
        {
            OptionsTests test_inspect(OptionsTests::test_inspect);
            report(test_inspect);
        }
        {
            OptionsTests test_version(OptionsTests::test_version);
            report(test_version);
        }
    }
    return (failures == 0) ? EXIT_SUCCESS : EXIT_FAILURE;
}
