// Command-line inspector: decode one activity file, segment it and print the
// canonical table statistics and metrics.

#include "core/Activity.hpp"
#include "core/PowerUtils.hpp"
#include "debug/TableInspect.hpp"
#include "io/ActivityDecoder.hpp"
#include "models/Errors.hpp"

#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

// ultra-light arg parser
struct Options {
  std::string input;         // positional: activity file
  std::optional<double> ftp; // --ftp 250
  std::optional<double> lthr; // --lthr 170
  std::string pace;           // --pace 7:30
  // --threshold, --keep-stopped, --debug-excise, --raw-grade
  ActivityParams params;
};

static bool parse(int argc, char **argv, Options &o) {
  for (int i = 1; i < argc; i++) {
    std::string a(argv[i]);
    auto next = [&]() -> const char * {
      if (i + 1 < argc)
        return argv[++i];
      std::cerr << "missing value after " << a << "\n";
      return nullptr;
    };
    if (a == "--ftp") {
      const char *v = next();
      if (!v)
        return false;
      o.ftp = std::stod(v);
    } else if (a == "--lthr") {
      const char *v = next();
      if (!v)
        return false;
      o.lthr = std::stod(v);
    } else if (a == "--pace") {
      const char *v = next();
      if (!v)
        return false;
      o.pace = v;
    } else if (a == "--threshold") {
      const char *v = next();
      if (!v)
        return false;
      o.params.stopped_threshold = std::stod(v);
    } else if (a == "--keep-stopped") {
      o.params.remove_stopped_periods = false;
    } else if (a == "--debug-excise") {
      o.params.retain_excised = true;
    } else if (a == "--raw-grade") {
      o.params.smooth_grade = false;
    } else if (!a.empty() && a[0] != '-' && o.input.empty()) {
      o.input = a;
    } else {
      std::cerr << "Unknown arg: " << a << "\n";
      return false;
    }
  }
  return !o.input.empty();
}

int main(int argc, char **argv) {
  Options opt;
  bool ok = false;
  try {
    ok = parse(argc, argv, opt);
  } catch (const std::logic_error &e) {
    std::cerr << "bad numeric argument: " << e.what() << "\n";
  }
  if (!ok) {
    std::cerr << "Usage: activity_inspect <file.fit|.tcx|.gpx|.json> "
                 "[--ftp W] [--pace M:SS] [--lthr bpm] [--threshold m/s] "
                 "[--keep-stopped] [--debug-excise] [--raw-grade]\n";
    return 2;
  }

  try {
    Activity act(decode_file(opt.input), opt.params);
    std::optional<double> ftp = opt.ftp;
    if (!ftp && !opt.pace.empty())
      ftp = power::flat_run_power(opt.pace);

    std::cout << std::fixed << std::setprecision(3);
    print_activity(act);
    std::cout << "mean_power=" << fmt_opt(act.mean_power())
              << "  norm_power=" << fmt_opt(act.norm_power())
              << "  intensity=" << fmt_opt(act.intensity(ftp), 3)
              << "  training_stress=" << fmt_opt(act.training_stress(ftp), 1)
              << "\n"
              << "mean_hr=" << fmt_opt(act.mean_heart_rate())
              << "  hr_intensity=" << fmt_opt(act.hr_intensity(opt.lthr), 3)
              << "  hr_training_stress="
              << fmt_opt(act.hr_training_stress(opt.lthr), 1) << "\n"
              << "distance=" << fmt_opt(act.total_distance())
              << " m  gain=" << fmt_opt(act.elevation_gain())
              << " m  loss=" << fmt_opt(act.elevation_loss()) << " m\n";
  } catch (const ActivityError &e) {
    std::cerr << "[ERROR] " << e.what() << "\n";
    return 3;
  } catch (const std::exception &e) {
    std::cerr << "[ERROR] " << e.what() << "\n";
    return 4;
  }
  return 0;
}
