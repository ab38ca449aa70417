// Unit coverage for the timestamp codec: dialects, dirty fractions, failures, round trip.
#include <cstdint>
#include <string>

#include "test_utils.hpp"
#include "timestamp.hpp"

using vttforge::decode_timestamp;
using vttforge::encode_timestamp;

namespace {

bool check(bool cond, const std::string &msg) { return test_utils::check("timestamp_unit", cond, msg); }

bool decodes_to(const std::string &text, int64_t expected) {
    auto v = decode_timestamp(text);
    return check(v.has_value() && *v == expected,
                 "decode(\"" + text + "\") == " + std::to_string(expected) + ", got " +
                     (v ? std::to_string(*v) : std::string("<fail>")));
}

bool rejects(const std::string &text) {
    std::string error;
    auto v = decode_timestamp(text, &error);
    bool ok = check(!v.has_value(), "decode(\"" + text + "\") should fail");
    ok &= check(!error.empty(), "failure reason for \"" + text + "\" should be set");
    return ok;
}

bool test_dialects() {
    bool ok = decodes_to("46.550", 46550);
    ok &= decodes_to("46", 46000);
    ok &= decodes_to("46,550", 46550);
    ok &= decodes_to("0.0005", 1);  // rounds half up
    ok &= decodes_to("1.2344", 1234);
    ok &= decodes_to("00:00:01.000", 1000);
    ok &= decodes_to("01:02.250", 62250);
    ok &= decodes_to("1:02:03,500", 3723500);
    ok &= decodes_to("  00:01:00.5  ", 60500);
    ok &= decodes_to("12:34", 12 * 60000 + 34000);
    ok &= decodes_to("100:00:00.000", 360000000);
    return ok;
}

bool test_dirty_fractions() {
    bool ok = decodes_to("55:56.03.800", (55 * 60 + 56) * 1000 + 38);
    ok &= decodes_to("00:00:01.", 1000);
    ok &= decodes_to("00:00:01.7", 1700);
    ok &= decodes_to("00:00:01.12345", 1123);
    ok &= decodes_to("00:00:01.1a2", 1120);
    ok &= decodes_to("00:00:.500", 500);
    return ok;
}

bool test_failures() {
    bool ok = rejects("");
    ok &= rejects("   ");
    ok &= rejects("1:2:3:4");
    ok &= rejects("abc");
    ok &= rejects("aa:10.000");
    ok &= rejects("00:bb:10.000");
    ok &= rejects("00:00:xx.000");
    ok &= rejects(":10.000");
    ok &= rejects("46.");
    ok &= rejects("99999999999999999999:00.000");
    return ok;
}

bool test_encode() {
    bool ok = check(encode_timestamp(0) == "00:00:00.000", "encode(0)");
    ok &= check(encode_timestamp(-5) == "00:00:00.000", "negative clamps to zero");
    ok &= check(encode_timestamp(3723500) == "01:02:03.500", "encode(3723500)");
    ok &= check(encode_timestamp(360000000) == "100:00:00.000", "hours are not wrapped");
    return ok;
}

bool test_round_trip() {
    bool ok = true;
    const int64_t samples[] = {0,       1,        999,       1000,       59999,    60000,
                               3599999, 3600000,  86399999,  86400000,   123456789};
    for (int64_t m : samples) {
        auto back = decode_timestamp(encode_timestamp(m));
        ok &= check(back.has_value() && *back == m,
                    "decode(encode(" + std::to_string(m) + ")) round-trips");
    }
    for (int64_t m = 0; m < 7'200'000; m += 7919) {
        auto back = decode_timestamp(encode_timestamp(m));
        if (!back || *back != m) {
            return check(false, "sweep round trip failed at " + std::to_string(m));
        }
    }
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_dialects();
    ok &= test_dirty_fractions();
    ok &= test_failures();
    ok &= test_encode();
    ok &= test_round_trip();
    if (!ok) {
        return 1;
    }
    std::cout << "timestamp_unit OK\n";
    return 0;
}
