#include <tint/config.hpp>
#include <tint/error.hpp>
#include <tint/markup.hpp>
#include <tint/styled.hpp>
#include <tint/util/log.hpp>

#include <boost/leaf/handle_errors.hpp>
#include <fmt/core.h>
#include <fmt/ostream.h>

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

static std::string
highlight(const tint::style& st, std::string_view text, tint::should_style should) {
    if (should == tint::should_style::never) {
        return std::string(text);
    }
    return tint::to_string(st.applied_to(text));
}

static void print_usage(std::string_view program_name, tint::should_style should) {
    fmt::print(std::cerr,
               fmt::runtime(
                   tint::stylize("Usage: {} .bold[<markup>] [.bold[<markup>] ...]\n", should)),
               program_name);
    fmt::print(std::cerr,
               "\nEach argument is rendered as markup and printed on its own line, e.g.:\n"
               "  {} '.bold.red[error:] something went .italic[wrong]'\n"
               "\nEnvironment:\n"
               "  TINT_PLAIN           Print the text without escape sequences\n"
               "  TINT_LENIENT_MARKUP  Ignore unknown style classes instead of failing\n"
               "  TINT_LOG_LEVEL       One of trace, debug, info, warn, error, critical, silent\n",
               program_name);
}

int main_fn(std::string_view program_name, const std::vector<std::string>& argv) {
    tint::log::init_logger();
    tint::log::current_log_level = tint::config::default_log_level();

    const auto should = tint::config::default_should_style();
    if (argv.empty()) {
        print_usage(program_name, should);
        return 2;
    }
    if (argv.front() == "-h" || argv.front() == "--help") {
        print_usage(program_name, should);
        return 0;
    }

    tint_log(debug, "Rendering {} markup argument(s)", argv.size());

    return boost::leaf::try_catch(
        [&] {
            for (auto& arg : argv) {
                fmt::print("{}\n", tint::stylize(arg, should));
            }
            return 0;
        },
        [&](tint::invalid_markup const& err,
            tint::e_markup_string      str,
            tint::e_markup_offset      off,
            tint::e_markup_class       cls,
            tint::e_did_you_mean       dym) {
            tint_log(error,
                     "{}: '{}'",
                     err.what(),
                     highlight(tint::style{}.bold().fg(tint::basic_color::red), cls.value, should));
            tint_log(error, "  in \"{}\" (at offset {})", str.value, off.value);
            if (dym.value) {
                auto suggestion = tint::style{}.fg(tint::bright(tint::basic_color::yellow));
                tint_log(error,
                         "  (Did you mean '{}'?)",
                         highlight(suggestion, *dym.value, should));
            }
            return 2;
        },
        [&](tint::invalid_markup const& err, tint::e_markup_string str, tint::e_markup_offset off) {
            tint_log(error, "{}", err.what());
            tint_log(error, "  in \"{}\" (at offset {})", str.value, off.value);
            return 2;
        },
        [&](std::exception const& err) {
            tint_log(critical, "An unhandled error occurred: {}", err.what());
            return 1;
        });
}

int main(int argc, char** argv) { return main_fn(argv[0], {argv + 1, argv + argc}); }
