/// @file src/main.cpp
/// @brief cosmotag CLI entry point.
///
/// Usage:
///   cosmotag --info <file>               Print an array with its tag
///   cosmotag --to-physical <in> <out>    Convert a text array to physical
///   cosmotag --to-comoving <in> <out>    Convert a text array to comoving
///   cosmotag --ufuncs                    List the dispatch table
///   cosmotag --help                      Print usage

#include "cosmotag/cosmo_array.hpp"
#include "cosmotag/dispatch.hpp"
#include "cosmotag/text_io.hpp"
#include "cosmotag/ufunc.hpp"

#include <fmt/core.h>

#include <optional>
#include <string>

namespace {

using cosmotag::io::TextIO;

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  cosmotag --info <file>               Print array, tag and redshift\n"
        "  cosmotag --to-physical <in> <out>    Convert a text array to physical\n"
        "  cosmotag --to-comoving <in> <out>    Convert a text array to comoving\n"
        "  cosmotag --ufuncs                    List the dispatch table\n"
        "  cosmotag --help                      Show this help\n"
        "\n"
        "Text format:\n"
        "  # units: kpc\n"
        "  # comoving: true\n"
        "  # a_exponent: 1\n"
        "  # scale_factor: 0.5\n"
        "  value\n"
        "  1.0\n"
    );
}

/// Load `filepath`, reporting a missing file on stderr.
std::optional<cosmotag::CosmoArray> load(const std::string& filepath) {
    auto array = TextIO::load_text(filepath);
    if (!array) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", filepath);
    }
    return array;
}

/// Print an array and its tag. Returns 0 on success, 1 on error.
int run_info(const std::string& filepath) {
    const auto array = load(filepath);
    if (!array) {
        return 1;
    }

    fmt::print("{}\n", array->to_string());
    fmt::print("units:        {}\n", array->units().expr());
    fmt::print("dtype:        {}\n", cosmotag::to_string(array->dtype()));
    fmt::print("size:         {}\n", array->size());
    fmt::print("comoving:     {}\n", array->comoving());
    if (const auto& cf = array->cosmo_factor()) {
        fmt::print("cosmo_factor: {}\n", cf->to_string());
        fmt::print("a_factor:     {}\n", cf->a_factor());
        fmt::print("redshift:     {}\n", cf->redshift());
    } else {
        fmt::print("cosmo_factor: none\n");
    }
    if (const auto& c = array->compression()) {
        fmt::print("compression:  {}\n", *c);
    }
    return 0;
}

/// Convert `in` to the requested frame and write it to `out`.
/// Returns 0 on success, 1 on error.
int run_convert(const std::string& in, const std::string& out, bool to_physical) {
    auto array = load(in);
    if (!array) {
        return 1;
    }

    if (to_physical) {
        array->convert_to_physical();
    } else {
        array->convert_to_comoving();
    }

    if (!TextIO::save_text(*array, out)) {
        fmt::print(stderr, "Error: cannot write file '{}'\n", out);
        return 1;
    }
    fmt::print("Wrote {} {} values to '{}'\n",
               array->size(), to_physical ? "physical" : "comoving", out);
    return 0;
}

/// Print every operation with its rule and arity.
int run_ufuncs() {
    for (cosmotag::Ufunc op : cosmotag::all_ufuncs()) {
        fmt::print("{:<14} {:<16} inputs={} outputs={}\n",
                   cosmotag::ufunc_name(op),
                   cosmotag::to_string(cosmotag::rule_for(op)),
                   cosmotag::ufunc_arity(op),
                   cosmotag::ufunc_output_count(op));
    }
    return 0;
}

int dispatch(int argc, char* argv[]) {
    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (mode == "--info") {
        if (argc < 3) {
            fmt::print(stderr, "Error: --info requires a file path\n");
            print_usage();
            return 1;
        }
        return run_info(argv[2]);
    }

    if (mode == "--to-physical" || mode == "--to-comoving") {
        if (argc < 4) {
            fmt::print(stderr, "Error: {} requires an input and an output path\n", mode);
            print_usage();
            return 1;
        }
        return run_convert(argv[2], argv[3], mode == "--to-physical");
    }

    if (mode == "--ufuncs") {
        return run_ufuncs();
    }

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return 1;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    try {
        return dispatch(argc, argv);
    } catch (const cosmotag::CosmoError& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }
}
