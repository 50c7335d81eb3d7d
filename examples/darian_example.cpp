#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>

#include <darian.hpp>

using namespace darian;

// Helper function to print a date-time or the reason it cannot be shown
void printDateTime(const Result<DateTime>& dt, const std::string& label) {
    std::cout << label << ":\n";
    if (!dt) {
        std::cout << "  Error: " << calendar_error_string(dt.error()) << "\n\n";
        return;
    }
    auto text = to_string(*dt);
    std::cout << "  " << (text ? *text : std::string(calendar_error_string(text.error())));
    if (auto name = dt->zone_name()) {
        std::cout << " (" << *name << ")";
    }
    std::cout << "\n";
    std::cout << "  Sol of year: " << dt->day_of_year() << ", weekday: " << dt->weekday()
              << "\n";
    std::cout << std::endl;
}

int main() {
    std::cout << "DARIAN Calendar Examples\n";
    std::cout << "========================\n\n";

    // Example 1: Earth instants on Mars
    std::cout << "1. Earth Instants on Mars\n";
    std::cout << "-------------------------\n";

    printDateTime(earth_to_mars(std::chrono::system_clock::now()), "Now (MTC)");
    printDateTime(datetime_from_posix(0.0), "POSIX epoch");

    auto fields = mars_fields_from_posix(1'000'000'000.0);
    if (fields) {
        std::cout << "POSIX 1000000000 as raw fields:\n";
        std::cout << "  " << fields->year << "-" << std::setfill('0') << std::setw(2)
                  << fields->month << "-" << std::setw(2) << fields->sol << " "
                  << std::setw(2) << fields->hour << ":" << std::setw(2) << fields->minute
                  << ":" << std::fixed << std::setprecision(6) << std::setw(9)
                  << fields->second << std::setfill(' ') << "\n\n";
        std::cout.unsetf(std::ios::fixed);
    }

    // Example 2: Duration arithmetic
    std::cout << "2. Duration Arithmetic\n";
    std::cout << "----------------------\n";

    auto shift = Duration::from_parts({.sols = 1, .minutes = 30, .hours = 2});
    auto half = shift.and_then([](const Duration& d) { return d / int64_t{2}; });
    if (shift && half) {
        std::cout << "  Shift:      " << to_string(*shift) << "\n";
        std::cout << "  Half shift: " << to_string(*half) << "\n";
        std::cout << "  Seconds:    " << shift->total_seconds() << "\n";
    }

    auto earth_day = earth_to_mars(std::chrono::hours(24));
    if (earth_day) {
        std::cout << "  One Earth day on Mars: " << to_string(*earth_day) << "\n";
    }
    auto sol = Duration::from_sols(1).and_then(
        [](const Duration& d) { return mars_to_earth(d); });
    if (sol) {
        std::cout << "  One sol on Earth: " << sol->count() << " us\n";
    }

    auto too_long = Duration::from_sols(1'000'000'000);
    if (!too_long) {
        std::cout << "  1e9 sols: " << calendar_error_string(too_long.error()) << "\n";
    }
    std::cout << std::endl;

    // Example 3: Offsets and conversion between providers
    std::cout << "3. Offsets\n";
    std::cout << "----------\n";

    auto offset = Duration::from_parts({.minutes = 30, .hours = 5});
    auto colony = offset.and_then([](const Duration& d) { return FixedOffset::create(d); });
    if (!colony) {
        std::cout << "  Error: " << calendar_error_string(colony.error()) << "\n";
        return 1;
    }

    auto noon = DateTime::from_fields(219, 13, 27, 12, 0, 0, 0, FixedOffset::mtc());
    printDateTime(noon, "Noon MTC");
    printDateTime(noon.and_then([&](const DateTime& dt) { return dt.astimezone(*colony); }),
                  "Same instant at " + (*colony)->display_name());

    // Mixing naive and aware values is reported, not guessed
    auto naive = DateTime::from_fields(219, 13, 27, 12);
    if (naive && noon) {
        auto diff = *naive - *noon;
        if (!diff) {
            std::cout << "Naive minus aware: " << calendar_error_string(diff.error()) << "\n";
        }
    }

    return 0;
}
