#include "responder_scroll_area.hpp"
#include <QApplication>
#include <QChildEvent>
#include <QDebug>
#include <QEasingCurve>
#include <QInputMethod>
#include <QKeyEvent>
#include <QLineEdit>
#include <QMouseEvent>
#include <QScrollBar>
#include <QTimer>
#include <QVariantAnimation>
#include <algorithm>
#include <cmath>

ResponderScrollArea::ResponderScrollArea(KeyboardPersistTaps persistTaps, QWidget *parent)
    : QScrollArea(parent), tracker_(&log_) {
  setMinimumSize(360, 600);
  setFocusPolicy(Qt::StrongFocus);
  setWidgetResizable(true);
  setVerticalScrollBarPolicy(Qt::ScrollBarAlwaysOff);
  setHorizontalScrollBarPolicy(Qt::ScrollBarAlwaysOff);

  props_.keyboardShouldPersistTaps = persistTaps;
  props_.onScrollResponderKeyboardDismissed = [](const srx::PressEvent &) {
    qDebug("keyboard dismissed by tap");
  };
  props_.onKeyboardWillShow = [](const std::optional<srx::KeyboardEvent> &e) {
    if (e)
      qDebug("keyboard will show, top at %g", double(e->endCoordinates.screenY));
  };

  FrameRateLogger::Options fr;
  fr.debug = true;
  tracker_.setGlobalOptions(fr);
  tracker_.setContext("scroll-demo");

  scrollableHandle_ = handleFor(viewport());
  ScrollNodes nodes;
  nodes.scrollable = scrollableHandle_;
  responder_ = std::make_unique<ScrollResponder>(
      props_, nodes,
      ResponderServices{inputs_, tracker_, keyboard_, *this, *this, clock_, log_});
  responder_->attach();

  inputs_.setBlurHook([this](srx::NodeHandle h) {
    if (QWidget *w = widgetFor(h))
      w->clearFocus();
    hideKeyboard();
  });

  viewport()->installEventFilter(this);
  connect(verticalScrollBar(), &QScrollBar::valueChanged, this,
          [this](int) { responder_->handleScroll(scrollEvent()); });
  connect(qApp, &QApplication::focusChanged, this, &ResponderScrollArea::onFocusChanged);

  QInputMethod *im = QGuiApplication::inputMethod();
  connect(im, &QInputMethod::visibleChanged, this, &ResponderScrollArea::onInputMethodChanged);
  connect(im, &QInputMethod::keyboardRectangleChanged, this,
          &ResponderScrollArea::onInputMethodChanged);

  momentum_ = new QVariantAnimation(this);
  momentum_->setEasingCurve(QEasingCurve::OutCubic);
  connect(momentum_, &QVariantAnimation::valueChanged, this,
          [this](const QVariant &v) { verticalScrollBar()->setValue(v.toInt()); });
  connect(momentum_, &QVariantAnimation::finished, this,
          [this]() { responder_->handleMomentumScrollEnd(scrollEvent()); });

  scrollAnim_ = new QVariantAnimation(this);
  scrollAnim_->setDuration(250);
  scrollAnim_->setEasingCurve(QEasingCurve::InOutQuad);
  connect(scrollAnim_, &QVariantAnimation::valueChanged, this, [this](const QVariant &v) {
    const QPoint p = v.toPoint();
    horizontalScrollBar()->setValue(p.x());
    verticalScrollBar()->setValue(p.y());
  });
}

ResponderScrollArea::~ResponderScrollArea() {
  disconnect(qApp, nullptr, this, nullptr);
  disconnect(verticalScrollBar(), nullptr, this, nullptr);
  responder_->detach();
}

void ResponderScrollArea::setContent(QWidget *content) {
  setWidget(content);
  // handles of the previous content must not stay text inputs
  inputs_.unregisterAll();
  nodes_.clear();
  scrollableHandle_ = handleFor(viewport());
  contentHandle_ = handleFor(content);

  ScrollNodes nodes;
  nodes.scrollable = scrollableHandle_;
  nodes.innerView = contentHandle_;
  responder_->setNodes(nodes);

  for (QLineEdit *le : content->findChildren<QLineEdit *>())
    inputs_.registerInput(handleFor(le));
  watchTree(content);
}

srx::NodeHandle ResponderScrollArea::handleFor(QWidget *w) {
  for (auto it = nodes_.cbegin(); it != nodes_.cend(); ++it)
    if (it.value() == w)
      return it.key();
  const srx::NodeHandle h = nextHandle_++;
  nodes_.insert(h, w);
  return h;
}

QWidget *ResponderScrollArea::widgetFor(srx::NodeHandle h) const {
  auto it = nodes_.constFind(h);
  return it == nodes_.cend() ? nullptr : it.value().data();
}

// nearest registered ancestor (or self)
std::optional<srx::NodeHandle> ResponderScrollArea::targetAt(QWidget *w) const {
  for (; w; w = w->parentWidget())
    for (auto it = nodes_.cbegin(); it != nodes_.cend(); ++it)
      if (it.value() == w)
        return it.key();
  return std::nullopt;
}

void ResponderScrollArea::watchTree(QWidget *w) {
  w->installEventFilter(this);
  for (QWidget *child : w->findChildren<QWidget *>())
    child->installEventFilter(this);
}

srx::PressEvent ResponderScrollArea::pressEvent(QWidget *w, const QPoint &globalPos,
                                                int touches) const {
  srx::PressEvent e;
  e.target = targetAt(w);
  e.touches = touches;
  const QPoint local = viewport()->mapFromGlobal(globalPos);
  e.location = {float(local.x()), float(local.y())};
  return e;
}

srx::ScrollEvent ResponderScrollArea::scrollEvent() const {
  srx::ScrollEvent e;
  e.target = scrollableHandle_;
  e.contentOffset = {float(horizontalScrollBar()->value()), float(verticalScrollBar()->value())};
  return e;
}

bool ResponderScrollArea::eventFilter(QObject *watched, QEvent *event) {
  QWidget *w = qobject_cast<QWidget *>(watched);
  if (!w)
    return QScrollArea::eventFilter(watched, event);

  switch (event->type()) {
  case QEvent::ChildAdded: {
    auto *ce = static_cast<QChildEvent *>(event);
    if (auto *cw = qobject_cast<QWidget *>(ce->child()))
      cw->installEventFilter(this);
    break;
  }
  case QEvent::MouseButtonPress: {
    auto *me = static_cast<QMouseEvent *>(event);
    if (me->button() == Qt::LeftButton)
      return onPress(w, me);
    break;
  }
  case QEvent::MouseMove: {
    auto *me = static_cast<QMouseEvent *>(event);
    if (me->buttons() & Qt::LeftButton)
      return onMove(w, me);
    break;
  }
  case QEvent::MouseButtonRelease: {
    auto *me = static_cast<QMouseEvent *>(event);
    if (me->button() == Qt::LeftButton)
      return onRelease(w, me);
    break;
  }
  default:
    break;
  }
  return QScrollArea::eventFilter(watched, event);
}

bool ResponderScrollArea::onPress(QWidget *w, QMouseEvent *me) {
  const QPoint g = me->globalPosition().toPoint();
  pressPos_ = last_ = g;
  velocity_ = {};
  moveTimer_.start();

  // grabbing a decelerating surface: the native side reports momentum end first
  stopMomentum();

  const srx::PressEvent e = pressEvent(w, g, 1);
  bool claim = responder_->handleStartShouldSetResponderCapture(e);
  responder_->handleTouchStart(e);
  // text inputs take their own presses unless the capture phase claimed them
  const bool childTakes = e.target && inputs_.isTextInput(*e.target);
  if (!claim && !childTakes)
    claim = responder_->handleStartShouldSetResponder(e);
  if (claim) {
    grant(e);
    return true;
  }
  return false;
}

bool ResponderScrollArea::onMove(QWidget *w, QMouseEvent *me) {
  const QPoint g = me->globalPosition().toPoint();
  const srx::PressEvent e = pressEvent(w, g, 1);
  responder_->handleTouchMove(e);

  if (!isResponder_) {
    if ((g - pressPos_).manhattanLength() < QApplication::startDragDistance())
      return false;
    if (!responder_->handleScrollShouldSetResponder())
      return false;
    grant(e);
  }

  if (!dragging_) {
    dragging_ = true;
    responder_->handleScrollBeginDrag(scrollEvent());
  }
  const QPoint d = g - last_;
  last_ = g;
  const qint64 dt = std::max<qint64>(1, moveTimer_.restart());
  velocity_ = QPointF(-d.x() / double(dt), -d.y() / double(dt));
  verticalScrollBar()->setValue(verticalScrollBar()->value() - d.y());
  return true;
}

bool ResponderScrollArea::onRelease(QWidget *w, QMouseEvent *me) {
  const srx::PressEvent e = pressEvent(w, me->globalPosition().toPoint(), 0);
  responder_->handleTouchEnd(e);
  if (!isResponder_)
    return false;

  if (dragging_) {
    // a finger resting before lift leaves no momentum
    if (moveTimer_.elapsed() > 80)
      velocity_ = {};
    srx::ScrollEvent se = scrollEvent();
    se.velocity = srx::vec2{float(velocity_.x()), float(velocity_.y())};
    responder_->handleScrollEndDrag(se);
    if (velocity_.y() != 0.0)
      startMomentum(float(velocity_.y()));
  }
  responder_->handleResponderRelease(e);
  isResponder_ = false;
  dragging_ = false;
  return true;
}

void ResponderScrollArea::grant(const srx::PressEvent &e) {
  isResponder_ = true;
  responder_->handleResponderGrant(e);
}

void ResponderScrollArea::startMomentum(float velocityY) {
  QScrollBar *bar = verticalScrollBar();
  const int from = bar->value();
  const int to = std::clamp(from + int(velocityY * 350.f), bar->minimum(), bar->maximum());
  if (to == from)
    return;
  momentum_->setStartValue(from);
  momentum_->setEndValue(to);
  momentum_->setDuration(int(std::min(1200.f, 250.f + std::abs(velocityY) * 300.f)));
  responder_->handleMomentumScrollBegin(scrollEvent());
  momentum_->start();
}

void ResponderScrollArea::stopMomentum() {
  if (momentum_->state() != QAbstractAnimation::Running)
    return;
  momentum_->stop(); // no finished() on stop
  responder_->handleMomentumScrollEnd(scrollEvent());
}

void ResponderScrollArea::animateTo(const QPoint &target, bool animated) {
  scrollAnim_->stop();
  const QPoint from(horizontalScrollBar()->value(), verticalScrollBar()->value());
  if (!animated) {
    horizontalScrollBar()->setValue(target.x());
    verticalScrollBar()->setValue(target.y());
    return;
  }
  scrollAnim_->setStartValue(from);
  scrollAnim_->setEndValue(target);
  scrollAnim_->start();
}

void ResponderScrollArea::dispatchCommand(srx::NodeHandle target, const std::string &name,
                                          const CommandArgs &args) {
  if (target != scrollableHandle_) {
    qWarning("command %s for unknown node %d", name.c_str(), target);
    return;
  }
  if (name == commands::kScrollTo && args.size() == 3) {
    const double x = std::get<double>(args[0]);
    const double y = std::get<double>(args[1]);
    // negative y pulls content down; the bars clamp it
    animateTo(QPoint(int(std::lround(x)), int(std::lround(y))), std::get<bool>(args[2]));
  } else if (name == commands::kScrollToEnd && args.size() == 1) {
    animateTo(QPoint(horizontalScrollBar()->value(), verticalScrollBar()->maximum()),
              std::get<bool>(args[0]));
  } else if (name == commands::kFlashScrollIndicators) {
    setVerticalScrollBarPolicy(Qt::ScrollBarAlwaysOn);
    QTimer::singleShot(800, this, [this]() { setVerticalScrollBarPolicy(Qt::ScrollBarAlwaysOff); });
  } else {
    qWarning("unsupported scroll command %s", name.c_str());
  }
}

void ResponderScrollArea::measureLayout(srx::NodeHandle target, srx::NodeHandle relativeTo,
                                        MeasureError onError, MeasureSuccess onSuccess) {
  QPointer<QWidget> t = widgetFor(target);
  QPointer<QWidget> rel = widgetFor(relativeTo);
  // answer on the next turn of the event loop, like a native measurement
  QTimer::singleShot(0, this, [t, rel, target, onError, onSuccess]() {
    if (!t || !rel) {
      onError("node " + std::to_string(target) + " is not mounted");
      return;
    }
    const QPoint p = rel->mapFromGlobal(t->mapToGlobal(QPoint(0, 0)));
    onSuccess(float(p.x()), float(p.y()), float(t->width()), float(t->height()));
  });
}

// the viewport stands in for the screen
float ResponderScrollArea::windowHeight() const { return float(viewport()->height()); }

void ResponderScrollArea::onFocusChanged(QWidget *old, QWidget *now) {
  const auto nowTarget = now ? targetAt(now) : std::nullopt;
  if (nowTarget && inputs_.isTextInput(*nowTarget)) {
    inputs_.focusTextInput(*nowTarget);
    responder_->scrollNativeHandleToKeyboard(*nowTarget, 8.f, true);
    return;
  }
  const auto oldTarget = old ? targetAt(old) : std::nullopt;
  if (oldTarget)
    inputs_.blurTextInput(*oldTarget);
}

void ResponderScrollArea::showKeyboard(const QRect &frame) {
  srx::KeyboardEvent e;
  e.endCoordinates = {float(frame.x()), float(frame.y()), float(frame.width()),
                      float(frame.height())};
  e.duration = 250.0;
  keyboard_.publish(srx::KeyboardEventType::WillShow, e);
  keyboardUp_ = true;
  keyboard_.publish(srx::KeyboardEventType::DidShow, e);
}

void ResponderScrollArea::hideKeyboard() {
  if (!keyboardUp_)
    return;
  keyboardUp_ = false;
  srx::KeyboardEvent e;
  e.endCoordinates = {0.f, windowHeight(), float(viewport()->width()), 0.f};
  keyboard_.publish(srx::KeyboardEventType::WillHide, e);
  keyboard_.publish(srx::KeyboardEventType::DidHide, e);
  QGuiApplication::inputMethod()->hide();
}

void ResponderScrollArea::onInputMethodChanged() {
  QInputMethod *im = QGuiApplication::inputMethod();
  if (!im->isVisible()) {
    hideKeyboard();
    return;
  }
  const QRect r = im->keyboardRectangle().toRect();
  if (r.isEmpty())
    return;
  showKeyboard(QRect(viewport()->mapFrom(window(), r.topLeft()), r.size()));
}

void ResponderScrollArea::keyPressEvent(QKeyEvent *e) {
  if (e->key() == Qt::Key_F2) {
    // desktop has no soft keyboard: simulate one covering the lower 40%
    if (keyboardUp_) {
      hideKeyboard();
    } else {
      const int h = viewport()->height();
      showKeyboard(QRect(0, h * 6 / 10, viewport()->width(), h - h * 6 / 10));
    }
    return;
  }
  if (e->key() == Qt::Key_Home) {
    responder_->scrollTo(ScrollToOptions{0.f, 0.f, true});
    return;
  }
  if (e->key() == Qt::Key_End) {
    responder_->scrollToEnd();
    return;
  }
  if (e->key() == Qt::Key_F) {
    responder_->flashScrollIndicators();
    return;
  }
  QScrollArea::keyPressEvent(e);
}
