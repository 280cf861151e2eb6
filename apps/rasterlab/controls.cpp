#include "controls.hpp"
#include <QImage>
#include <QPainter>
#include <QMouseEvent>
#include <QWheelEvent>
#include <QKeyEvent>
#include <QString>
#include <QtGlobal>
#include "raster_scene.hpp"

RasterWidget::RasterWidget(RasterScene* scene, QWidget* parent)
    : QWidget(parent), scene_(scene) {
    setMinimumSize(600, 600);
    setFocusPolicy(Qt::StrongFocus);
    scene_->setZoom(8);
    updateTitle();
}

void RasterWidget::paintEvent(QPaintEvent*) {
    const auto& px = scene_->render();
    QImage img(reinterpret_cast<const uchar*>(px.data()),
               width(), height(), width()*4, QImage::Format_ARGB32);
    QPainter p(this);
    p.drawImage(0, 0, img);

    // pending control points as small crosses
    const int z = scene_->viewport().zoom();
    p.setPen(Qt::red);
    for (const auto& c : pending_) {
        const auto s = scene_->viewport().toScreen(c.x, c.y);
        const int cx = s.x + z/2, cy = s.y + z/2;
        p.drawLine(cx-4, cy, cx+4, cy);
        p.drawLine(cx, cy-4, cx, cy+4);
    }
    updateTitle();
}

void RasterWidget::resizeEvent(QResizeEvent*) {
    scene_->resize(width(), height());
    update();
}

void RasterWidget::mousePressEvent(QMouseEvent* e) {
    if (e->button() != Qt::LeftButton) return;
    const auto p = scene_->viewport().fromScreen(e->pos().x(), e->pos().y());
    pending_.push_back(p);
    if (int(pending_.size()) >= raster::controlPointCount(algo_)) {
        if (!scene_->add(RasterScene::requestFromPoints(algo_, pending_)))
            qWarning("rejected %s", raster::algorithmName(algo_));
        pending_.clear();
    }
    update();
}

void RasterWidget::wheelEvent(QWheelEvent* e) {
    const int steps = e->angleDelta().y() / 120;
    if (steps != 0) {
        scene_->zoomBy(steps);
        e->accept();
        update();
    } else {
        QWidget::wheelEvent(e);
    }
}

void RasterWidget::keyPressEvent(QKeyEvent* e) {
    switch (e->key()) {
    case Qt::Key_Space:
        algo_ = raster::nextAlgorithm(algo_);
        pending_.clear();
        break;
    case Qt::Key_Plus:
    case Qt::Key_Equal:
        scene_->zoomBy(1);
        break;
    case Qt::Key_Minus:
        scene_->zoomBy(-1);
        break;
    case Qt::Key_B:
        scene_->toggleMonochrome();
        break;
    case Qt::Key_C:
        scene_->cycleColors();
        break;
    case Qt::Key_Escape:
        pending_.clear();
        scene_->clear();
        break;
    default:
        QWidget::keyPressEvent(e);
        return;
    }
    update();
}

void RasterWidget::updateTitle() {
    setWindowTitle(QString("rasterlab - %1 (%2/%3)  |  %4 primitives, %5 samples, %6 ns")
                       .arg(raster::algorithmName(algo_))
                       .arg(pending_.size())
                       .arg(raster::controlPointCount(algo_))
                       .arg(scene_->size())
                       .arg(scene_->sampleCount())
                       .arg(scene_->lastElapsedNs()));
}
