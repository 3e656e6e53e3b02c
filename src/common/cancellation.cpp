#include "common/cancellation.hpp"

namespace runner {
using namespace std;

bool cancellation_token::cancel(cancel_reason reason) {
    scoped_lock lock(mut);
    if (cancelled.load()) return false;
    why.store(reason);
    cancelled.store(true);
    for (auto &[id, cb] : callbacks) cb(reason);
    callbacks.clear();
    return true;
}

bool cancellation_token::is_cancelled() const noexcept {
    return cancelled.load();
}

cancel_reason cancellation_token::reason() const noexcept {
    return why.load();
}

uint64_t cancellation_token::on_cancel(callback cb) {
    scoped_lock lock(mut);
    uint64_t id = ++next_id;
    if (cancelled.load())
        cb(why.load());
    else
        callbacks.emplace(id, move(cb));
    return id;
}

void cancellation_token::remove_callback(uint64_t id) {
    scoped_lock lock(mut);
    callbacks.erase(id);
}

cancellation_registration::cancellation_registration(shared_ptr<cancellation_token> token, cancellation_token::callback cb)
    : token(move(token)) {
    if (this->token) id = this->token->on_cancel(move(cb));
}

cancellation_registration::~cancellation_registration() {
    if (token) token->remove_callback(id);
}

}  // namespace runner
