#include "responder_scroll_area.hpp"
#include <QApplication>
#include <QCommandLineParser>
#include <QLabel>
#include <QLineEdit>
#include <QVBoxLayout>
#include <QWidget>

static QWidget *buildContent(int rows) {
  auto *content = new QWidget;
  auto *layout = new QVBoxLayout(content);
  for (int i = 0; i < rows; ++i) {
    if (i % 12 == 5) {
      auto *edit = new QLineEdit;
      edit->setPlaceholderText(QString("Field %1").arg(i / 12 + 1));
      layout->addWidget(edit);
    } else {
      auto *label = new QLabel(QString("Row %1").arg(i + 1));
      label->setMinimumHeight(40);
      layout->addWidget(label);
    }
  }
  return content;
}

int main(int argc, char **argv) {
  QApplication qapp(argc, argv);
  QApplication::setApplicationName("scroll-demo");

  QCommandLineParser parser;
  parser.setApplicationDescription(
      "Drag to scroll, tap outside a field to dismiss the keyboard.\n"
      "F2 toggles a simulated keyboard, Home/End scroll, F flashes indicators.");
  parser.addHelpOption();
  QCommandLineOption persistOpt("persist-taps", "Tap-dismiss policy: never, always or handled.",
                                "policy", "never");
  QCommandLineOption rowsOpt("rows", "Number of content rows.", "n", "80");
  parser.addOptions({persistOpt, rowsOpt});
  parser.process(qapp);

  KeyboardPersistTaps persist = KeyboardPersistTaps::Never;
  const QString p = parser.value(persistOpt);
  if (p == "always")
    persist = KeyboardPersistTaps::Always;
  else if (p == "handled")
    persist = KeyboardPersistTaps::Handled;
  else if (p != "never") {
    qWarning("Usage: scroll-demo [--persist-taps never|always|handled] [--rows n]");
    return 1;
  }
  bool ok = false;
  const int rows = parser.value(rowsOpt).toInt(&ok);
  if (!ok || rows <= 0) {
    qWarning("--rows must be a positive number");
    return 1;
  }

  ResponderScrollArea area(persist);
  area.setContent(buildContent(rows));
  area.resize(420, 720);
  area.show();

  return qapp.exec();
}
