#include <QCommandLineParser>
#include <QCoreApplication>
#include <QStringList>
#include <iostream>
#include <string>

#include "event_script.hpp"
#include "responder_log.hpp"
#include "script_player.hpp"

static bool parse_persist(const QString &s, KeyboardPersistTaps &out) {
  if (s == "never")
    out = KeyboardPersistTaps::Never;
  else if (s == "always")
    out = KeyboardPersistTaps::Always;
  else if (s == "handled")
    out = KeyboardPersistTaps::Handled;
  else
    return false;
  return true;
}

int main(int argc, char **argv) {
  QCoreApplication app(argc, argv);
  QCoreApplication::setApplicationName("responder-replay");

  QCommandLineParser parser;
  parser.setApplicationDescription(
      "Replays a timestamped event script through a scroll responder and prints\n"
      "every command, host callback and keyboard dismissal it causes.\n"
      "\n"
      "Script lines:  <ms> <event> [key=value ...]   (# starts a comment)\n"
      "  0   momentumBegin\n"
      "  100 momentumEnd\n"
      "  110 captureShouldSet target=5");
  parser.addHelpOption();
  parser.addPositionalArgument("script", "Event script to replay.");
  QCommandLineOption thresholdOpt("threshold", "Animating window after momentum end (ms).", "ms",
                                  QString::number(ResponderState::kDefaultAnimatingThresholdMs));
  QCommandLineOption heightOpt("window-height", "Window height used without a keyboard frame.",
                               "px", "800");
  QCommandLineOption persistOpt("persist-taps", "Tap-dismiss policy: never, always or handled.",
                                "policy", "never");
  QCommandLineOption zoomOpt("zoom", "Pretend the platform supports zoomToRect.");
  QCommandLineOption disableOpt("disable-pan", "Disable the scroll view pan responder.");
  QCommandLineOption verboseOpt({"v", "verbose"}, "Print debug diagnostics.");
  parser.addOptions({thresholdOpt, heightOpt, persistOpt, zoomOpt, disableOpt, verboseOpt});
  parser.process(app);

  const QStringList args = parser.positionalArguments();
  if (args.size() != 1) {
    std::cerr << parser.helpText().toStdString();
    return 1;
  }

  ReplayOptions opts;
  bool ok = false;
  opts.animatingThresholdMs = parser.value(thresholdOpt).toDouble(&ok);
  if (!ok || opts.animatingThresholdMs < 0.0) {
    std::cerr << "Invalid --threshold\n";
    return 1;
  }
  opts.windowHeight = parser.value(heightOpt).toFloat(&ok);
  if (!ok) {
    std::cerr << "Invalid --window-height\n";
    return 1;
  }
  if (!parse_persist(parser.value(persistOpt), opts.persistTaps)) {
    std::cerr << "Invalid --persist-taps (never|always|handled)\n";
    return 1;
  }
  opts.zoomSupported = parser.isSet(zoomOpt);
  opts.disablePanResponder = parser.isSet(disableOpt);

  EventScript script;
  if (!script.load(args.front().toStdString())) {
    std::cerr << "Failed to load script: " << script.error << "\n";
    return 2;
  }

  opts.traceInteractions = parser.isSet(verboseOpt);
  StderrLog log(std::cerr, parser.isSet(verboseOpt));

  ScriptPlayer player(std::cout, log, opts);
  if (!player.play(script)) {
    std::cerr << "Replay failed: " << player.error() << "\n";
    return 3;
  }

  const FrameRateLogger &fr = player.frameRateLogger();
  std::cout << "scroll interactions: " << fr.begunCount() << " begun, " << fr.endedCount()
            << " ended, " << fr.redundantEnds() << " redundant ends\n";
  return 0;
}
