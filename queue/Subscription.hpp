// Structured unsubscribe handle for queue events. Move-only; disconnects on
// destruction or on unsubscribe().
#pragma once
#include <QMetaObject>
#include <QObject>

namespace vrpkg {

class Subscription {
public:
    Subscription() = default;
    explicit Subscription(QMetaObject::Connection c) : conn_(c) {}
    ~Subscription() { unsubscribe(); }

    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;
    Subscription(Subscription &&other) noexcept : conn_(other.conn_) {
        other.conn_ = QMetaObject::Connection();
    }
    Subscription &operator=(Subscription &&other) noexcept {
        if (this != &other) {
            unsubscribe();
            conn_ = other.conn_;
            other.conn_ = QMetaObject::Connection();
        }
        return *this;
    }

    void unsubscribe() {
        if (conn_)
            QObject::disconnect(conn_);
        conn_ = QMetaObject::Connection();
    }
    bool active() const { return bool(conn_); }

private:
    QMetaObject::Connection conn_;
};

} // namespace vrpkg
