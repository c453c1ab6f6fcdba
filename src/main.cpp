#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "basen/alphabets.hpp"
#include "basen/cli.hpp"
#include "basen/codec.hpp"
#include "basen/file.hpp"

int main(int argc, char** argv)
{
    try
    {
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i)
        {
            args.emplace_back(argv[i]);
        }
        basen::Options options = basen::parse_args(args);

        if (options.mode == basen::Mode::List)
        {
            for (const std::string& name : basen::alphabets::names())
            {
                std::cout << name << "\n";
            }
            return 0;
        }

        const basen::Codec codec = basen::make_codec(options);
        if (options.mode == basen::Mode::Encode)
        {
            basen::encode_file(options.input_path, options.output_path, codec);
        }
        else
        {
            basen::decode_file(options.input_path, options.output_path, codec);
        }
    }
    catch (const std::exception& ex)
    {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
    return 0;
}
