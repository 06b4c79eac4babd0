#include <chrono>
#include <iostream>
#include <string>

#include <mediatime.hpp>
#include <mediatime/format.hpp>
#include <mediatime/mediatime_utils.hpp>

using namespace mediatime;

// Helper function to print an instant next to its codec timestamp
void printInstant(Instant t, const std::string& label) {
    auto codec = CodecInstant::from_instant(t);
    std::cout << label << ":\n";
    std::cout << fmt::format("  Nanoseconds: {}\n", t.nanoseconds());
    std::cout << fmt::format("  UTC time:    {}\n", t);
    std::cout << fmt::format("  Codec PTS:   {}\n", codec.ticks());
    std::cout << std::endl;
}

int main() {
    std::cout << "mediatime Codec Timestamp Examples\n";
    std::cout << "==================================\n\n";

    // Example 1: Creating instants
    std::cout << "1. Creating Instants\n";
    std::cout << "--------------------\n";

    auto now = Instant::now();
    printInstant(now, "Current time");

    auto fixed = Instant::from_nanoseconds(1'699'000'000'500'000'000);
    printInstant(fixed, "From nanoseconds (1699000000.5 s)");

    if (auto from_chrono = Instant::from_chrono(std::chrono::system_clock::now())) {
        printInstant(*from_chrono, "From std::chrono::system_clock");
    }

    // Example 2: Wall-clock arithmetic
    std::cout << "2. Instant Arithmetic\n";
    std::cout << "---------------------\n";

    auto deadline = fixed.checked_add(Span::from_seconds(30));
    if (!deadline) {
        std::cerr << "deadline overflows\n";
        return 1;
    }
    printInstant(*deadline, "Base + 30 seconds");

    if (auto gap = deadline->difference(fixed)) {
        std::cout << fmt::format("Difference: {}\n", *gap);
    }
    std::cout << "deadline after base: " << (deadline->after(fixed) ? "true" : "false") << "\n";
    std::cout << "Instant::max() as never-expires: " << fmt::format("{}", Instant::max())
              << "\n\n";

    // Example 3: Converting durations to the 90 kHz timescale
    std::cout << "3. Codec Spans\n";
    std::cout << "--------------\n";

    if (auto five_minutes = Span::from_minutes(5)) {
        auto ticks = five_minutes->to_codec_span();
        std::cout << fmt::format("5 minutes = {} = {} ms\n", ticks, ticks.to_milliseconds());
        if (auto back = ticks.to_span()) {
            std::cout << fmt::format("Back to nanoseconds: {}\n", *back);
        }
    }

    auto frame = CodecSpan::from_ticks(3003);
    auto ten_seconds = CodecSpan::from_ticks(10 * CodecSpan::TICKS_PER_SECOND);
    if (auto frames = ten_seconds.checked_div(frame)) {
        std::cout << fmt::format("Whole 29.97 fps frames in 10 s: {}\n", *frames);
    }

    auto narrowed = CodecSpan::from_ticks(-1).to_u32();
    if (!narrowed) {
        std::cout << "to_u32 of -1 ticks: " << narrowed.error().message() << "\n";
    }
    std::cout << "\n";

    // Example 4: Generating presentation timestamps
    std::cout << "4. Frame Clock\n";
    std::cout << "--------------\n";

    auto ntsc = utils::frame_duration_from_rate(30'000, 1'001);
    if (!ntsc) {
        std::cerr << "29.97 fps is not a whole number of ticks\n";
        return 1;
    }

    FrameClock<> clock(*ntsc, StartTime::at_next_second());
    std::cout << fmt::format("Frame duration: {}\n", clock.frame_duration());
    std::cout << fmt::format("Start PTS:      {}\n", clock.start());
    for (int i = 0; i < 3; ++i) {
        if (auto pts = clock.tick()) {
            std::cout << fmt::format("Frame {} PTS:    {}\n", clock.elapsed_frames(), *pts);
        }
    }
    std::cout << fmt::format("Elapsed: {} ({:.6f} s)\n", clock.elapsed(),
                             clock.elapsed().to_seconds());

    return 0;
}
