#include <iostream>
#include <ranges>
#include <handoff/pipeline.hpp>

int main()
{
    const auto got = handoff::run(std::views::iota(0, 10), 3);
    for (const auto n : got) {
        std::cout << n << '\n';
    }
}
