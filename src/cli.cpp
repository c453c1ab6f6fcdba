#include "basen/cli.hpp"

#include <optional>
#include <stdexcept>
#include <string>

#include "basen/alphabets.hpp"
#include "basen/utf8.hpp"

namespace basen
{

namespace
{

constexpr const char* kUsage =
    "Usage: basen <encode|decode> [--alphabet NAME | --charset SYMBOLS] [--separator SYMBOL]"
    " [--input PATH] [--output PATH]\n"
    "       basen --list";

}  // namespace

Options parse_args(const std::vector<std::string>& args)
{
    if (args.empty())
    {
        throw std::runtime_error(kUsage);
    }

    Options opts;
    const std::string& mode = args[0];
    if (mode == "encode")
    {
        opts.mode = Mode::Encode;
    }
    else if (mode == "decode")
    {
        opts.mode = Mode::Decode;
    }
    else if (mode == "--list")
    {
        if (args.size() != 1)
        {
            throw std::runtime_error("--list takes no further arguments");
        }
        opts.mode = Mode::List;
        return opts;
    }
    else
    {
        throw std::runtime_error("First argument must be 'encode', 'decode' or '--list'");
    }

    for (std::size_t i = 1; i < args.size(); ++i)
    {
        const std::string& tok = args[i];
        auto require_value = [&](const char* flag) -> const std::string&
        {
            if (i + 1 >= args.size())
            {
                throw std::runtime_error(std::string("Missing value for ") + flag);
            }
            return args[++i];
        };

        if (tok == "--input" || tok == "-i")
        {
            opts.input_path = require_value(tok.c_str());
        }
        else if (tok == "--output" || tok == "-o")
        {
            opts.output_path = require_value(tok.c_str());
        }
        else if (tok == "--alphabet" || tok == "-a")
        {
            opts.alphabet = require_value(tok.c_str());
            opts.alphabet_provided = true;
        }
        else if (tok == "--charset" || tok == "-c")
        {
            opts.charset = require_value(tok.c_str());
            opts.charset_provided = true;
        }
        else if (tok == "--separator" || tok == "-s")
        {
            opts.separator = require_value(tok.c_str());
            if (opts.separator.empty())
            {
                throw std::runtime_error("--separator must not be empty");
            }
        }
        else
        {
            throw std::runtime_error("Unknown option: " + tok);
        }
    }

    if (opts.alphabet_provided && opts.charset_provided)
    {
        throw std::runtime_error("--alphabet and --charset are mutually exclusive");
    }
    if (opts.charset_provided && opts.charset.empty())
    {
        throw std::runtime_error("--charset must not be empty");
    }

    return opts;
}

Codec make_codec(const Options& options)
{
    if (options.charset_provided)
    {
        return Codec(std::string_view(options.charset), options.separator);
    }
    std::optional<std::u32string> alphabet = alphabets::find(options.alphabet);
    if (!alphabet)
    {
        throw std::runtime_error("Unknown alphabet: " + options.alphabet);
    }
    const std::string utf8_alphabet = to_utf8(*alphabet);
    return Codec(std::string_view(utf8_alphabet), options.separator);
}

}  // namespace basen
