#include "../include/data_source.h"
#include "../include/engine_config.h"
#include "../include/errors.h"
#include "../include/game_predictor.h"
#include "../include/logging.h"
#include <iostream>
#include <json/json.h>
#include <stdexcept>
#include <string>

using namespace std;

// --- Helper Functions ---

struct CliOptions {
  string data_path;
  string config_path;
  SimulationConfig sim;
  bool series = false;
  SeriesConfig series_config;
  bool json = false;
  bool verbose = false;
};

void print_usage() {
  cerr << "Usage: hockey_predictor --data <fixture.json> --home <id> --away "
          "<id>\n"
       << "         --season <id> --date <YYYY-MM-DD> [--config "
          "<engine.json>]\n"
       << "         [--iterations N] [--seed S] [--workers W] [--series]\n"
       << "         [--series-score H-A] [--overtime shootout|draw] [--json]\n"
       << "         [--no-synergy] [--no-clutch] [--no-fatigue] "
          "[--no-momentum] [--verbose]\n";
}

bool parse_int(const string &text, int &out) {
  try {
    size_t used = 0;
    out = stoi(text, &used);
    return used == text.size();
  } catch (const invalid_argument &) {
    return false;
  } catch (const out_of_range &) {
    return false;
  }
}

bool parse_seed(const string &text, uint64_t &out) {
  try {
    size_t used = 0;
    out = stoull(text, &used);
    return used == text.size() && text[0] != '-';
  } catch (const invalid_argument &) {
    return false;
  } catch (const out_of_range &) {
    return false;
  }
}

bool parse_series_score(const string &text, SeriesConfig &series) {
  size_t dash = text.find('-');
  if (dash == string::npos)
    return false;
  return parse_int(text.substr(0, dash), series.home_wins) &&
         parse_int(text.substr(dash + 1), series.away_wins);
}

// Returns false and explains on stderr for any bad argument.
bool parse_args(int argc, char *argv[], CliOptions &opts) {
  bool have_home = false, have_away = false, have_season = false;
  for (int i = 1; i < argc; ++i) {
    string arg = argv[i];
    auto value = [&](string &out) {
      if (i + 1 >= argc) {
        cerr << "Missing value for " << arg << "\n";
        return false;
      }
      out = argv[++i];
      return true;
    };

    string v;
    if (arg == "--data") {
      if (!value(opts.data_path))
        return false;
    } else if (arg == "--config") {
      if (!value(opts.config_path))
        return false;
    } else if (arg == "--home") {
      if (!value(v) || !parse_int(v, opts.sim.home_team))
        return false;
      have_home = true;
    } else if (arg == "--away") {
      if (!value(v) || !parse_int(v, opts.sim.away_team))
        return false;
      have_away = true;
    } else if (arg == "--season") {
      if (!value(v) || !parse_int(v, opts.sim.season_id))
        return false;
      have_season = true;
    } else if (arg == "--date") {
      if (!value(opts.sim.game_date))
        return false;
    } else if (arg == "--iterations") {
      if (!value(v) || !parse_int(v, opts.sim.iteration_count))
        return false;
    } else if (arg == "--seed") {
      uint64_t seed;
      if (!value(v) || !parse_seed(v, seed))
        return false;
      opts.sim.random_seed = seed;
    } else if (arg == "--workers") {
      if (!value(v) || !parse_int(v, opts.sim.workers))
        return false;
    } else if (arg == "--series") {
      opts.series = true;
    } else if (arg == "--series-score") {
      if (!value(v) || !parse_series_score(v, opts.series_config))
        return false;
      opts.series = true;
    } else if (arg == "--overtime") {
      if (!value(v))
        return false;
      if (v == "shootout")
        opts.sim.overtime_policy = OvertimePolicy::SHOOTOUT;
      else if (v == "draw")
        opts.sim.overtime_policy = OvertimePolicy::DRAW;
      else
        return false;
    } else if (arg == "--json") {
      opts.json = true;
    } else if (arg == "--no-synergy") {
      opts.sim.use_synergy = false;
    } else if (arg == "--no-clutch") {
      opts.sim.use_clutch = false;
    } else if (arg == "--no-fatigue") {
      opts.sim.use_fatigue = false;
    } else if (arg == "--no-momentum") {
      opts.sim.use_momentum = false;
    } else if (arg == "--verbose") {
      opts.verbose = true;
    } else {
      cerr << "Unknown argument: " << arg << "\n";
      return false;
    }
  }

  if (opts.data_path.empty() || !have_home || !have_away || !have_season ||
      opts.sim.game_date.empty()) {
    cerr << "--data, --home, --away, --season and --date are required\n";
    return false;
  }
  return true;
}

// --- Main ---

int main(int argc, char *argv[]) {
  CliOptions opts;
  if (!parse_args(argc, argv, opts)) {
    print_usage();
    return 2;
  }
  set_log_level(opts.verbose ? LogLevel::DEBUG : LogLevel::WARN);

  try {
    EngineConfig config = opts.config_path.empty()
                              ? default_engine_config()
                              : load_engine_config(opts.config_path);
    InMemoryDataSource source = load_fixture(opts.data_path);
    GamePredictor predictor(config, source);

    if (opts.series) {
      SeriesResult series =
          predictor.predict_series(opts.sim, opts.series_config);
      if (opts.json) {
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        cout << Json::writeString(builder, series_to_json(series)) << "\n";
      } else {
        cout << render_series_summary(series);
      }
      return 0;
    }

    SimulationResult result = predictor.predict(opts.sim);
    if (opts.json)
      cout << result.to_json_string() << "\n";
    else
      cout << result.render_summary();
  } catch (const HockeyError &e) {
    const ErrorPayload &p = e.payload();
    cerr << "[ERROR] " << to_string(e.kind()) << ": " << p.detail;
    if (!p.scope.empty())
      cerr << " (" << p.scope << ")";
    if (p.entity_id >= 0)
      cerr << " entity " << p.entity_id;
    cerr << "\n";
    return 1;
  } catch (const invalid_argument &e) {
    cerr << "[ERROR] InvalidArgument: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
