#pragma once
#include <QPoint>
#include <QWidget>
#include <vector>

#include "dispatcher.hpp"
#include "raster_math.hpp"

class RasterScene;

class RasterWidget : public QWidget {
  Q_OBJECT
public:
  explicit RasterWidget(RasterScene *scene, QWidget *parent = nullptr);

protected:
  void paintEvent(QPaintEvent *) override;
  void resizeEvent(QResizeEvent *) override;
  void mousePressEvent(QMouseEvent *) override;
  void wheelEvent(QWheelEvent *) override;
  void keyPressEvent(QKeyEvent *) override;

private:
  RasterScene *scene_;
  raster::Algorithm algo_ = raster::Algorithm::BresenhamLine;
  std::vector<rmx::ivec2> pending_; // clicked, not yet a primitive
  void updateTitle();
};
