#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>
#include <random>
#include <fstream>
#include <iostream>

// Synthetic dataset touching every inference path: ids, ints, floats with outliers,
// booleans, dates with noise, low-cardinality categories, emails and null tokens.
int main(int argc, char** argv){
  if (argc < 4){
    std::cerr << "usage: gen_synth_csv <out.csv> <rows> <quoted:0|1> [null_pct]\n";
    return 2;
  }
  const std::string out = argv[1];
  const std::uint64_t rows = std::strtoull(argv[2], nullptr, 10);
  const bool quoted = std::string(argv[3]) == "1";
  const int null_pct = argc > 4 ? std::atoi(argv[4]) : 2;

  std::ofstream f(out, std::ios::binary);
  if (!f){ std::cerr << "open failed: " << out << "\n"; return 2; }

  // header; raw names on purpose so the synthesizer has work to do
  f << "Customer ID,Order Date!,Amount ($),Quantity,Is Active,Region,Contact Email,Notes\n";

  std::mt19937_64 rng(42);
  std::uniform_int_distribution<int> dq(1, 250);
  std::normal_distribution<double> da(120.0, 35.0);
  std::uniform_int_distribution<int> dpct(0, 99);
  const char* regions[] = {"North","South","East","West"};
  const char* words[] = {"alpha","bravo","charlie","delta","echo","foxtrot"};
  const char* nulls[] = {"", "NA", "null", "N/A"};

  for (std::uint64_t i=1;i<=rows;++i){
    auto emit = [&](const std::string& x){
      if (!quoted) { f << x; return; }
      f << '"';
      for (char c: x){ if (c=='"') f << "\"\""; else f << c; }
      f << '"';
    };
    auto maybe_null = [&](const std::string& x) -> std::string {
      return dpct(rng) < null_pct ? std::string(nulls[i % 4]) : x;
    };

    int y = 2023 + int(i % 3), m = 1 + int(i % 12), d = 1 + int(i % 28);
    char datebuf[32];
    std::snprintf(datebuf, sizeof(datebuf), "%04d-%02d-%02d", y, m, d);

    double amount = da(rng);
    if (i % 997 == 0) amount *= 50.0; // outliers
    char amountbuf[32];
    std::snprintf(amountbuf, sizeof(amountbuf), "%.2f", amount);

    std::string note = words[i % 6];
    if (quoted && (i % 17 == 0)) note += ", said \"hi\"\non two lines";

    emit(std::to_string(i)); f << ",";
    emit(maybe_null(datebuf)); f << ",";
    emit(maybe_null(amountbuf)); f << ",";
    emit(maybe_null(std::to_string(dq(rng)))); f << ",";
    emit((i % 3) == 0 ? "yes" : "no"); f << ",";
    emit(regions[i % 4]); f << ",";
    emit("user" + std::to_string(i) + "@example.com"); f << ",";
    emit(note);
    f << "\n";
  }
  std::cerr << "wrote " << rows << " rows to " << out << "\n";
  return 0;
}
