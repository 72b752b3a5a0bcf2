#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>

#include <handoff/error.hpp>
#include <handoff/log.hpp>
#include <handoff/pipeline.hpp>

// streams the lines of a file (or stdin) through a handoff pipeline and
// writes them back out in order

namespace {

/// single pass range over the lines of a stream, read as it is iterated
class line_reader {
public:
    class iterator {
    public:
        using iterator_concept = std::input_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;

        iterator() = default;
        explicit iterator(std::istream* in) : in_{in} { ++*this; }

        auto operator*() const -> const std::string& { return line_; }
        auto operator++() -> iterator&
        {
            if (!std::getline(*in_, line_)) {
                in_ = nullptr;
            }
            return *this;
        }
        void operator++(int) { ++*this; }

        friend auto operator==(const iterator& it, std::default_sentinel_t)
            -> bool
        {
            return it.in_ == nullptr;
        }

    private:
        std::istream* in_{nullptr};
        std::string line_;
    };

    explicit line_reader(std::istream& in) : in_{&in} {}

    auto begin() -> iterator { return iterator{in_}; }
    auto end() const -> std::default_sentinel_t { return {}; }

private:
    std::istream* in_;
};

struct args {
    std::ptrdiff_t capacity = 64;
    std::string file;
    bool verbose = false;
};

void usage(const char* prog)
{
    std::cerr << "Usage: " << prog
              << " [--capacity N] [--file PATH] [--verbose]\n";
}

auto parse_capacity(const char* s, std::ptrdiff_t& out) -> bool
{
    if (s == nullptr || *s == '\0') {
        return false;
    }
    char* endp = nullptr;
    errno = 0;
    const auto v = std::strtoll(s, &endp, 10);
    if (endp == nullptr || *endp != '\0' || errno == ERANGE) {
        return false;
    }
    out = static_cast<std::ptrdiff_t>(v);
    return true;
}

} // namespace

int main(int argc, char** argv)
{
    args a;

    for (int i = 1; i < argc; i++) {
        const std::string arg = argv[i];
        auto need = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << name << "\n";
                usage(argv[0]);
                std::exit(2);
            }
            return argv[++i];
        };

        if (arg == "--capacity") {
            if (!parse_capacity(need("--capacity"), a.capacity)) {
                std::cerr << "--capacity needs an integer in range\n";
                usage(argv[0]);
                return 2;
            }
        }
        else if (arg == "--file") {
            a.file = need("--file");
        }
        else if (arg == "--verbose") {
            a.verbose = true;
        }
        else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        }
        else {
            std::cerr << "Unknown arg: " << arg << "\n";
            usage(argv[0]);
            return 2;
        }
    }

    handoff::set_log_level(a.verbose ? handoff::log_level::debug
                                     : handoff::log_level::info);

    std::ifstream file;
    if (!a.file.empty()) {
        file.open(a.file);
        if (!file) {
            handoff::log(handoff::log_level::error,
                         "can't open " + a.file);
            return 1;
        }
    }
    std::istream& in = a.file.empty() ? std::cin : file;

    try {
        const auto lines = handoff::run(line_reader{in}, a.capacity);
        for (const auto& l : lines) {
            std::cout << l << '\n';
        }
        handoff::log(handoff::log_level::info,
                     "relayed " + std::to_string(lines.size()) + " lines from " +
                         (a.file.empty() ? std::string{"<stdin>"} : a.file));
    }
    catch (const std::invalid_argument& e) {
        handoff::log(handoff::log_level::error, e.what());
        usage(argv[0]);
        return 2;
    }
    catch (const handoff::pipeline_error& e) {
        handoff::log(handoff::log_level::error, e.what());
        return 1;
    }
    return 0;
}
