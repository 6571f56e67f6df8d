#include "options.hpp"
#include <iostream>
#include <cstdlib>
#include <stdexcept>
#include <system_error>

int main(int argc, char* argv[])
{
    uuidgen::Options options;
    try{
        options = uuidgen::parse_options(argc, argv);
    } catch(const std::invalid_argument& e){
        std::cerr << "uuidgen: " << e.what() << std::endl;
        std::cerr << "Try 'uuidgen --help' for more information." << std::endl;
        return EXIT_FAILURE;
    }

    if(options.help){
        std::cout << uuidgen::usage();
        return EXIT_SUCCESS;
    }
    if(options.version){
        std::cout << "uuidgen version " << uuidgen::version_string() << std::endl;
        return EXIT_SUCCESS;
    }

    try{
        uuidgen::validate(options);
        std::cout << uuidgen::dispatch(options) << std::endl;
    } catch(const std::invalid_argument& e){
        std::cerr << "uuidgen: Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    } catch(const std::system_error& e){
        std::cerr << "uuidgen: random source failed:" << e.code().message() << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
