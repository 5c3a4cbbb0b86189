#pragma once

#include <QObject>

namespace scout::network {

/**
 * ScanCancellation - lets the caller of a blocking scan stop it early.
 *
 * cancel() may be called before the scan starts, from a device callback, or
 * from any slot that runs on the scanning thread's event loop. The scan then
 * ends with whatever it has collected so far.
 */
class ScanCancellation final : public QObject {
    Q_OBJECT

public:
    explicit ScanCancellation(QObject* parent = nullptr) : QObject(parent) {}

    void cancel() {
        if (cancelled_) return;
        cancelled_ = true;
        emit requested();
    }

    [[nodiscard]] bool is_cancelled() const { return cancelled_; }

signals:
    void requested();

private:
    bool cancelled_ = false;
};

} // namespace scout::network
