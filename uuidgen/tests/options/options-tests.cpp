#include "options-tests.hpp"
#include <uuid/uuid.hpp>
#include <iostream>
#include <vector>
#include <string>
#include <stdexcept>

namespace tests
{
    // getopt_long permutes argv, so it gets its own mutable copy.
    static uuidgen::Options parse(std::vector<std::string> args){
        args.insert(args.begin(), "uuidgen");
        std::vector<char*> argv;
        for(std::string& arg: args){
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);
        return uuidgen::parse_options(static_cast<int>(args.size()), argv.data());
    }

    static bool parse_throws(const std::vector<std::string>& args){
        try{
            parse(args);
        } catch(const std::invalid_argument&){
            return true;
        }
        return false;
    }

    static bool validate_throws(const std::vector<std::string>& args){
        uuidgen::Options options = parse(args);
        try{
            uuidgen::validate(options);
        } catch(const std::invalid_argument&){
            return true;
        }
        return false;
    }

    OptionsTests::OptionsTests(OptionsTests::ParseFlags)
      : passed_{false},
        options_{}
    {
        options_ = parse({});
        if(options_.v4 || options_.v6 || options_.v7 || options_.timestamp || options_.inspect){
            return;
        }

        options_ = parse({"-6"});
        if(!options_.v6 || options_.v4 || options_.v7){
            return;
        }

        options_ = parse({"-7", "-t", "2023-06-14"});
        if(!options_.v7 || !options_.timestamp || *options_.timestamp != "2023-06-14"){
            return;
        }

        options_ = parse({"--timestamp", "2023-06-14 10:30:45", "--inspect"});
        if(!options_.timestamp || *options_.timestamp != "2023-06-14 10:30:45" || !options_.inspect){
            return;
        }

        options_ = parse({"--timestamp=1686742245"});
        if(!options_.timestamp || *options_.timestamp != "1686742245"){
            return;
        }

        // An empty value is still a timestamp, and the parser rejects it later.
        options_ = parse({"-t", ""});
        if(!options_.timestamp || !options_.timestamp->empty()){
            return;
        }

        options_ = parse({"-h"});
        if(!options_.help){
            return;
        }
        options_ = parse({"--version"});
        if(!options_.version){
            return;
        }
        passed_ = true;
    }

    OptionsTests::OptionsTests(OptionsTests::ParseErrors)
      : passed_{false},
        options_{}
    {
        if(!parse_throws({"-5"})){
            return;
        }
        if(!parse_throws({"--bogus"})){
            return;
        }
        if(!parse_throws({"-t"})){
            return;
        }
        if(!parse_throws({"--timestamp"})){
            return;
        }
        if(!parse_throws({"-4", "extra"})){
            return;
        }
        passed_ = true;
    }

    OptionsTests::OptionsTests(OptionsTests::Validate)
      : passed_{false},
        options_{}
    {
        if(validate_throws({}) || validate_throws({"-4"}) || validate_throws({"-6"}) || validate_throws({"-7"})){
            return;
        }
        if(validate_throws({"-t", "1686742245"}) || validate_throws({"-7", "-t", "1686742245"})){
            return;
        }
        if(!validate_throws({"-4", "-6"}) || !validate_throws({"-6", "-7"}) || !validate_throws({"-4", "-7"})){
            return;
        }
        if(!validate_throws({"-4", "-6", "-7"})){
            return;
        }
        if(!validate_throws({"-4", "-t", "1686742245"}) || !validate_throws({"-6", "-t", "1686742245"})){
            return;
        }

        // The message points at the accepted spellings.
        options_ = parse({"-6", "-t", "2023-06-14"});
        try{
            uuidgen::validate(options_);
            return;
        } catch(const std::invalid_argument& e){
            std::string what(e.what());
            if(what.find("uuidgen -7 -t 2023-06-14") == std::string::npos){
                return;
            }
        }
        passed_ = true;
    }

    OptionsTests::OptionsTests(OptionsTests::Dispatch)
      : passed_{false},
        options_{}
    {
        if(UUID::Uuid(uuidgen::dispatch(parse({}))).version() != 4){
            return;
        }
        if(UUID::Uuid(uuidgen::dispatch(parse({"-4"}))).version() != 4){
            return;
        }
        if(UUID::Uuid(uuidgen::dispatch(parse({"-6"}))).version() != 6){
            return;
        }
        if(UUID::Uuid(uuidgen::dispatch(parse({"-7"}))).version() != 7){
            return;
        }
        passed_ = true;
    }

    OptionsTests::OptionsTests(OptionsTests::DispatchTimestamp)
      : passed_{false},
        options_{}
    {
        UUID::Uuid pinned(uuidgen::dispatch(parse({"-t", "1686742245123"})));
        if(pinned.version() != 7 || pinned.unix_ts_ms() != 1686742245123ULL){
            return;
        }

        UUID::Uuid with_v7(uuidgen::dispatch(parse({"-7", "-t", "2023-06-14T10:30:45Z"})));
        if(with_v7.version() != 7 || with_v7.unix_ts_ms() != 1686738645000ULL){
            return;
        }

        // Parse errors propagate unchanged.
        options_ = parse({"-t", "not-a-timestamp"});
        try{
            uuidgen::dispatch(options_);
            return;
        } catch(const std::invalid_argument&){
        }
        options_ = parse({"-t", ""});
        try{
            uuidgen::dispatch(options_);
            return;
        } catch(const std::invalid_argument&){
        }
        passed_ = true;
    }

    OptionsTests::OptionsTests(OptionsTests::Inspect)
      : passed_{false},
        options_{}
    {
        std::string line = uuidgen::dispatch(parse({"-i", "-t", "2023-06-14"}));
        if(line.size() != 36 + std::string("\tversion=7\tunix_ms=1686700800000").size()){
            return;
        }
        if(line.substr(36) != "\tversion=7\tunix_ms=1686700800000"){
            return;
        }

        line = uuidgen::dispatch(parse({"-i"}));
        if(line.substr(36) != "\tversion=4"){
            return;
        }

        line = uuidgen::dispatch(parse({"-i", "-6"}));
        if(line.substr(36, 10) != "\tversion=6" || line.find("\tunix_ms=") != 46){
            return;
        }

        // Without -i the line is just the uuid.
        line = uuidgen::dispatch(parse({"-7"}));
        if(line.size() != 36){
            return;
        }
        passed_ = true;
    }

    OptionsTests::OptionsTests(OptionsTests::Version)
      : passed_{false},
        options_{}
    {
        std::string version = uuidgen::version_string();
        if(version.empty() || version.find("unknown") != std::string::npos){
            return;
        }
        if(uuidgen::usage().find("--timestamp") == std::string::npos){
            return;
        }
        passed_ = true;
    }
}
