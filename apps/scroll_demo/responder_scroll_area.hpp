#pragma once
#include <QElapsedTimer>
#include <QHash>
#include <QPoint>
#include <QPointF>
#include <QPointer>
#include <QScrollArea>
#include <memory>

#include "clock.hpp"
#include "frame_rate_logger.hpp"
#include "keyboard.hpp"
#include "qt_message_log.hpp"
#include "scroll_commands.hpp"
#include "scroll_props.hpp"
#include "scroll_responder.hpp"
#include "text_input_state.hpp"

class QVariantAnimation;

// Scroll surface that lets a ScrollResponder arbitrate its gestures. Mouse
// input stands in for touches; line edits in the content are text inputs.
class ResponderScrollArea : public QScrollArea,
                            public ScrollCommandSink,
                            public PlatformInfo {
  Q_OBJECT
public:
  explicit ResponderScrollArea(KeyboardPersistTaps persistTaps, QWidget *parent = nullptr);
  ~ResponderScrollArea() override;

  void setContent(QWidget *content);
  ScrollResponder &responder() { return *responder_; }

  // ScrollCommandSink
  void dispatchCommand(srx::NodeHandle target, const std::string &name,
                       const CommandArgs &args) override;
  void measureLayout(srx::NodeHandle target, srx::NodeHandle relativeTo, MeasureError onError,
                     MeasureSuccess onSuccess) override;

  // PlatformInfo
  bool supportsZoom() const override { return false; }
  float windowHeight() const override;

protected:
  bool eventFilter(QObject *watched, QEvent *event) override;
  void keyPressEvent(QKeyEvent *e) override;

private:
  ScrollProps props_;
  QtMessageLog log_;
  SteadyClock clock_{ResponderState::kDefaultAnimatingThresholdMs};
  KeyboardEmitter keyboard_;
  TextInputState inputs_;
  FrameRateLogger tracker_;
  std::unique_ptr<ScrollResponder> responder_;

  QHash<srx::NodeHandle, QPointer<QWidget>> nodes_;
  srx::NodeHandle nextHandle_ = 1;
  srx::NodeHandle scrollableHandle_ = 0;
  srx::NodeHandle contentHandle_ = 0;

  bool isResponder_ = false;
  bool dragging_ = false;
  bool keyboardUp_ = false;
  QPoint pressPos_, last_;
  QPointF velocity_;
  QElapsedTimer moveTimer_;
  QVariantAnimation *momentum_ = nullptr;
  QVariantAnimation *scrollAnim_ = nullptr;

  srx::NodeHandle handleFor(QWidget *w);
  QWidget *widgetFor(srx::NodeHandle h) const;
  std::optional<srx::NodeHandle> targetAt(QWidget *w) const;
  void watchTree(QWidget *w);

  srx::PressEvent pressEvent(QWidget *w, const QPoint &globalPos, int touches) const;
  srx::ScrollEvent scrollEvent() const;

  bool onPress(QWidget *w, QMouseEvent *e);
  bool onMove(QWidget *w, QMouseEvent *e);
  bool onRelease(QWidget *w, QMouseEvent *e);
  void grant(const srx::PressEvent &e);

  void startMomentum(float velocityY);
  void stopMomentum();
  void animateTo(const QPoint &target, bool animated);

  void onFocusChanged(QWidget *old, QWidget *now);
  void showKeyboard(const QRect &frame);
  void hideKeyboard();
  void onInputMethodChanged();
};
