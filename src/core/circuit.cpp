#include "mixnet/core/circuit.hpp"
#include "mixnet/util/logging.hpp"
#include <algorithm>

namespace mixnet::core {

const char* circuit_state_name(CircuitState state) {
    switch (state) {
        case CircuitState::Opening: return "opening";
        case CircuitState::Open: return "open";
        case CircuitState::Closing: return "closing";
        case CircuitState::Closed: return "closed";
        case CircuitState::Failed: return "failed";
        default: return "unknown";
    }
}

// --- Circuit ---

Circuit::Circuit(CircuitManager& manager, CircuitId id, bool initiator, NodeId remote,
                 Route route, CircuitKeys keys, policy::Priority priority,
                 CircuitClock::time_point now)
    : manager_(manager)
    , id_(id)
    , initiator_(initiator)
    , remote_(remote)
    , route_(std::move(route))
    , keys_(keys)
    , priority_(priority)
    , state_(initiator ? CircuitState::Opening : CircuitState::Open)
    , created_at_(now)
    , last_activity_(now) {}

CircuitState Circuit::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

std::optional<MixnetError> Circuit::error() const {
    std::lock_guard lock(mutex_);
    return error_;
}

size_t Circuit::in_flight() const {
    std::lock_guard lock(mutex_);
    return in_flight_.size();
}

size_t Circuit::buffered() const {
    std::lock_guard lock(mutex_);
    return pending_.size();
}

void Circuit::seal_locked(CircuitMessage msg, Outbox& out) {
    msg.circuit_id = id_;
    msg.counter = send_counter_++;
    auto wire = seal_circuit_message(msg, keys_);
    if (!wire) {
        fail_locked(wire.error());
        return;
    }
    out.push_back(std::move(*wire));
}

void Circuit::pump_locked(CircuitClock::time_point now, Outbox& out) {
    const size_t window = manager_.config_.window;
    while ((state_ == CircuitState::Open || state_ == CircuitState::Closing) &&
           in_flight_.size() < window && !pending_.empty()) {
        Segment seg = std::move(pending_.front());
        pending_.pop_front();
        seg.sent_at = now;

        CircuitMessage msg;
        msg.type = CircuitMessageType::Data;
        msg.seq = seg.seq;
        msg.data = seg.data;
        seal_locked(std::move(msg), out);

        in_flight_.emplace(seg.seq, std::move(seg));
    }
    maybe_send_fin_locked(now, out);
    cv_.notify_all();
}

void Circuit::maybe_send_fin_locked(CircuitClock::time_point now, Outbox& out) {
    if (state_ != CircuitState::Closing || fin_seq_ || !pending_.empty() || !in_flight_.empty()) {
        return;
    }
    fin_seq_ = next_seq_;
    fin_sent_at_ = now;

    CircuitMessage msg;
    msg.type = CircuitMessageType::Fin;
    msg.seq = *fin_seq_;
    seal_locked(std::move(msg), out);
}

void Circuit::send_ack_locked(Outbox& out) {
    CircuitMessage msg;
    msg.type = CircuitMessageType::Ack;
    msg.seq = expected_seq_;
    for (const auto& [seq, _] : reorder_) {
        if (msg.sacks.size() >= MAX_SACK_BLOCKS) break;
        msg.sacks.push_back(seq);
    }
    seal_locked(std::move(msg), out);
}

void Circuit::fail_locked(MixnetError err) {
    if (terminal_locked()) {
        return;
    }
    state_ = CircuitState::Failed;
    error_ = err;
    pending_.clear();
    in_flight_.clear();
    cv_.notify_all();
}

std::expected<void, MixnetError> Circuit::send(std::span<const uint8_t> data) {
    size_t offset = 0;
    const size_t max_buffered = manager_.config_.max_buffered;

    do {
        Outbox out;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [&] {
                return state_ != CircuitState::Open || pending_.size() < max_buffered;
            });
            if (state_ != CircuitState::Open) {
                return std::unexpected(error_.value_or(MixnetError::CircuitClosed));
            }

            while (offset < data.size() && pending_.size() < max_buffered) {
                size_t n = std::min(MAX_SEGMENT_LEN, data.size() - offset);
                auto chunk = data.subspan(offset, n);
                pending_.push_back(Segment{
                    .seq = next_seq_++,
                    .data = std::vector<uint8_t>(chunk.begin(), chunk.end()),
                });
                offset += n;
            }

            auto now = CircuitClock::now();
            last_activity_ = now;
            pump_locked(now, out);
        }
        manager_.transmit(*this, out);
    } while (offset < data.size());

    return {};
}

std::expected<std::optional<std::vector<uint8_t>>, MixnetError>
Circuit::take_ready_locked() {
    if (!ready_.empty()) {
        std::vector<uint8_t> joined;
        for (auto& chunk : ready_) {
            joined.insert(joined.end(), chunk.begin(), chunk.end());
        }
        ready_.clear();
        return joined;
    }
    if (state_ == CircuitState::Failed) {
        return std::unexpected(error_.value_or(MixnetError::CircuitClosed));
    }
    if (remote_finished_ || state_ == CircuitState::Closed) {
        return std::vector<uint8_t>{};
    }
    return std::nullopt;
}

std::expected<std::vector<uint8_t>, MixnetError> Circuit::recv() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return !ready_.empty() || remote_finished_ || terminal_locked(); });

    auto ready = take_ready_locked();
    if (!ready) {
        return std::unexpected(ready.error());
    }
    return ready->value_or(std::vector<uint8_t>{});
}

std::expected<std::optional<std::vector<uint8_t>>, MixnetError>
Circuit::recv_for(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, timeout,
                 [this] { return !ready_.empty() || remote_finished_ || terminal_locked(); });
    return take_ready_locked();
}

std::expected<void, MixnetError> Circuit::close() {
    Outbox out;
    {
        std::lock_guard lock(mutex_);
        if (state_ == CircuitState::Closed) {
            return {};
        }
        if (state_ == CircuitState::Failed) {
            return std::unexpected(error_.value_or(MixnetError::CircuitClosed));
        }
        if (state_ == CircuitState::Opening) {
            fail_locked(MixnetError::CircuitClosed);
        } else {
            state_ = CircuitState::Closing;
            pump_locked(CircuitClock::now(), out);
        }
    }
    manager_.transmit(*this, out);

    std::optional<MixnetError> failure;
    {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return fin_acked_ || terminal_locked(); });
        if (state_ == CircuitState::Failed) {
            failure = error_;
        } else if (state_ != CircuitState::Closed) {
            state_ = CircuitState::Closed;
            closed_at_ = CircuitClock::now();
            cv_.notify_all();
        }
    }
    manager_.report_closed(*this);

    if (failure) {
        return std::unexpected(*failure);
    }
    return {};
}

// --- CircuitManager ---

CircuitManager::CircuitManager(NodeId self,
                               const crypto::IdentitySecretKey& identity_key,
                               const crypto::OnionSecretKey& onion_key,
                               Config config,
                               PacketPath& path,
                               EventSink& events)
    : self_(self)
    , identity_key_(identity_key)
    , onion_key_(onion_key)
    , config_(config)
    , path_(path)
    , events_(events) {
    config_.window = std::max<size_t>(config_.window, 1);
    config_.max_buffered = std::max<size_t>(config_.max_buffered, 1);
}

CircuitManager::~CircuitManager() {
    stop();
}

void CircuitManager::start() {
    if (timer_.joinable()) {
        return;
    }
    timer_ = std::jthread([this](std::stop_token stop) { timer_loop(stop); });
}

void CircuitManager::stop() {
    if (timer_.joinable()) {
        timer_.request_stop();
        timer_.join();
    }

    std::vector<std::shared_ptr<Circuit>> all;
    {
        std::lock_guard lock(table_mutex_);
        for (const auto& [id, c] : circuits_) {
            all.push_back(c);
        }
    }
    for (const auto& c : all) {
        {
            std::lock_guard lock(c->mutex_);
            c->fail_locked(MixnetError::CircuitClosed);
        }
        report_closed(*c);
    }
    accept_cv_.notify_all();
}

void CircuitManager::timer_loop(std::stop_token stop) {
    std::mutex mutex;
    std::condition_variable_any cv;
    while (!stop.stop_requested()) {
        tick(CircuitClock::now());
        std::unique_lock lock(mutex);
        cv.wait_for(lock, stop, config_.tick, [] { return false; });
    }
}

std::expected<std::shared_ptr<Circuit>, MixnetError>
CircuitManager::open(const Route& route, policy::Priority priority) {
    if (route.empty() || route.size() > MAX_HOPS) {
        return std::unexpected(MixnetError::InvalidArgument);
    }
    const auto& dst = route.back();
    if (dst.node_id() == self_) {
        return std::unexpected(MixnetError::InvalidArgument);
    }

    auto ephemeral = crypto::OnionSecretKey::generate();
    if (!ephemeral) {
        return std::unexpected(MixnetError::CryptoFailure);
    }
    auto shared = ephemeral->diffie_hellman(dst.onion_key);
    if (!shared) {
        return std::unexpected(MixnetError::CryptoFailure);
    }

    CircuitId id = 0;
    {
        std::lock_guard lock(table_mutex_);
        do {
            id = crypto::random_u64();
        } while (id == 0 || circuits_.contains(id));
    }

    auto keys = CircuitKeys::derive(*shared, id, true);
    if (!keys) {
        return std::unexpected(keys.error());
    }
    auto signature = identity_key_.sign(
        open_signed_bytes(id, self_, ephemeral->public_key(), dst.node_id()));
    if (!signature) {
        return std::unexpected(MixnetError::CryptoFailure);
    }

    auto now = CircuitClock::now();
    auto circuit = std::make_shared<Circuit>(*this, id, true, dst.node_id(), route,
                                             *keys, priority, now);
    circuit->ephemeral_ = ephemeral->public_key();
    circuit->open_signature_ = *signature;
    {
        std::lock_guard lock(table_mutex_);
        circuits_.emplace(id, circuit);
    }

    LOG_DEBUG("circuit {:016x}: opening to {} over {} hops",
              id, dst.node_id().short_hex(), route.size());

    Circuit::Outbox out;
    {
        std::lock_guard lock(circuit->mutex_);
        circuit->open_sent_at_ = now;
        CircuitMessage msg;
        msg.type = CircuitMessageType::Open;
        msg.initiator = self_;
        msg.ephemeral = circuit->ephemeral_;
        msg.priority = static_cast<uint8_t>(priority);
        msg.open_signature = circuit->open_signature_;
        circuit->seal_locked(std::move(msg), out);
    }
    transmit(*circuit, out);

    std::optional<MixnetError> failure;
    {
        std::unique_lock lock(circuit->mutex_);
        circuit->cv_.wait_for(lock, config_.open_timeout,
                              [&] { return circuit->state_ != CircuitState::Opening; });
        if (circuit->state_ == CircuitState::Opening) {
            circuit->fail_locked(MixnetError::CircuitOpenTimeout);
        }
        if (circuit->state_ == CircuitState::Failed) {
            failure = circuit->error_;
        }
    }

    if (failure) {
        LOG_INFO("circuit {:016x}: open failed: {}", id, mixnet_error_name(*failure));
        report_closed(*circuit);
        remove(id);
        return std::unexpected(*failure);
    }

    events_.on_event(CircuitOpened{id, dst.node_id(), true});
    return circuit;
}

std::expected<std::shared_ptr<Circuit>, MixnetError>
CircuitManager::open_to(const NodeId& dst, policy::Priority priority) {
    auto route = path_.route_to(dst);
    if (!route) {
        return std::unexpected(route.error());
    }
    return open(*route, priority);
}

std::shared_ptr<Circuit> CircuitManager::accept(std::chrono::milliseconds timeout) {
    std::unique_lock lock(accept_mutex_);
    accept_cv_.wait_for(lock, timeout, [this] { return !accept_queue_.empty(); });
    if (accept_queue_.empty()) {
        return nullptr;
    }
    auto circuit = std::move(accept_queue_.front());
    accept_queue_.pop_front();
    return circuit;
}

void CircuitManager::transmit(Circuit& circuit, Circuit::Outbox& out) {
    for (const auto& wire : out) {
        auto sent = path_.send(circuit.route_, wire, circuit.priority_, circuit.id_);
        if (!sent && sent.error() == MixnetError::LinkDown) {
            {
                std::lock_guard lock(circuit.mutex_);
                circuit.fail_locked(MixnetError::LinkDown);
            }
            report_closed(circuit);
            break;
        }
        // Anything else is loss; retransmission recovers it
    }
    out.clear();
}

void CircuitManager::report_closed(Circuit& circuit) {
    std::optional<MixnetError> err;
    bool emit = false;
    {
        std::lock_guard lock(circuit.mutex_);
        if (!circuit.close_reported_ && circuit.terminal_locked()) {
            circuit.close_reported_ = true;
            emit = true;
            err = circuit.error_;
        }
    }
    if (!emit) {
        return;
    }
    events_.on_event(CircuitClosed{circuit.id_, err});
    if (err) {
        remove(circuit.id_);
    }
}

void CircuitManager::remove(CircuitId id) {
    std::lock_guard lock(table_mutex_);
    circuits_.erase(id);
}

void CircuitManager::handle_open(std::span<const uint8_t> payload, const CircuitHeader& header) {
    if (auto existing = find(header.circuit_id)) {
        // Retransmitted OPEN: the first OPEN_ACK was lost
        if (existing->initiator_ || existing->remote_ != header.initiator) {
            return;
        }
        auto msg = open_circuit_message(payload, existing->keys_);
        if (!msg) {
            return;
        }
        Circuit::Outbox out;
        {
            std::lock_guard lock(existing->mutex_);
            if (existing->terminal_locked()) {
                return;
            }
            CircuitMessage ack;
            ack.type = CircuitMessageType::OpenAck;
            existing->seal_locked(std::move(ack), out);
        }
        transmit(*existing, out);
        return;
    }

    if (header.initiator == self_ || header.ephemeral.is_low_order()) {
        return;
    }

    auto shared = onion_key_.diffie_hellman(header.ephemeral);
    if (!shared) {
        return;
    }
    auto keys = CircuitKeys::derive(*shared, header.circuit_id, false);
    if (!keys) {
        return;
    }
    auto msg = open_circuit_message(payload, *keys);
    if (!msg) {
        LOG_DEBUG("circuit {:016x}: OPEN failed authentication", header.circuit_id);
        return;
    }

    auto route = path_.route_to(header.initiator);
    if (!route) {
        LOG_WARN("circuit {:016x}: no route back to {}: {}",
                 header.circuit_id, header.initiator.short_hex(), mixnet_error_name(route.error()));
        return;
    }

    // The claimed initiator must have signed this open for us
    const auto& claimed = route->back();
    if (claimed.node_id() != header.initiator ||
        !claimed.identity_key.verify(
            open_signed_bytes(header.circuit_id, header.initiator, header.ephemeral, self_),
            msg->open_signature)) {
        LOG_WARN("circuit {:016x}: OPEN not signed by claimed initiator {}",
                 header.circuit_id, header.initiator.short_hex());
        return;
    }

    auto priority = static_cast<policy::Priority>(
        std::min<uint8_t>(msg->priority, policy::PRIORITY_LEVELS - 1));
    auto now = CircuitClock::now();
    auto circuit = std::make_shared<Circuit>(*this, header.circuit_id, false, header.initiator,
                                             std::move(*route), *keys, priority, now);
    (void)circuit->seen_counters_.check_and_insert(msg->counter);

    {
        std::lock_guard lock(table_mutex_);
        if (!circuits_.emplace(header.circuit_id, circuit).second) {
            return;
        }
    }

    Circuit::Outbox out;
    {
        std::lock_guard lock(circuit->mutex_);
        CircuitMessage ack;
        ack.type = CircuitMessageType::OpenAck;
        circuit->seal_locked(std::move(ack), out);
    }
    transmit(*circuit, out);

    {
        std::lock_guard lock(accept_mutex_);
        accept_queue_.push_back(circuit);
    }
    accept_cv_.notify_one();

    LOG_DEBUG("circuit {:016x}: accepted from {}", header.circuit_id, header.initiator.short_hex());
    events_.on_event(CircuitOpened{header.circuit_id, header.initiator, false});
}

void CircuitManager::deliver(std::vector<uint8_t> payload) {
    auto header = peek_circuit_header(payload);
    if (!header) {
        LOG_DEBUG("circuit: undecodable payload of {} bytes", payload.size());
        return;
    }
    if (header->type == CircuitMessageType::Open) {
        handle_open(payload, *header);
        return;
    }

    auto circuit = find(header->circuit_id);
    if (!circuit) {
        LOG_TRACE("circuit {:016x}: {} for unknown circuit",
                  header->circuit_id, circuit_message_type_name(header->type));
        return;
    }

    auto msg = open_circuit_message(payload, circuit->keys_);
    if (!msg) {
        LOG_DEBUG("circuit {:016x}: dropped {}: {}", header->circuit_id,
                  circuit_message_type_name(header->type), mixnet_error_name(msg.error()));
        return;
    }

    Circuit::Outbox out;
    {
        std::lock_guard lock(circuit->mutex_);
        auto& c = *circuit;
        auto now = CircuitClock::now();
        if (!c.seen_counters_.check_and_insert(msg->counter)) {
            return;
        }
        if (c.state_ == CircuitState::Failed) {
            return;
        }
        c.last_activity_ = now;

        switch (msg->type) {
            case CircuitMessageType::OpenAck:
                if (c.state_ == CircuitState::Opening) {
                    c.state_ = CircuitState::Open;
                    c.cv_.notify_all();
                }
                break;

            case CircuitMessageType::Data: {
                if (c.state_ == CircuitState::Opening || c.state_ == CircuitState::Closed) {
                    break;
                }
                // Bound the reorder buffer to a few windows ahead
                const uint64_t horizon = uint64_t{c.expected_seq_} + config_.window * 8;
                if (msg->seq >= c.expected_seq_ && msg->seq < horizon &&
                    !c.reorder_.contains(msg->seq)) {
                    c.reorder_.emplace(msg->seq, std::move(msg->data));
                }
                for (auto it = c.reorder_.find(c.expected_seq_); it != c.reorder_.end();
                     it = c.reorder_.find(c.expected_seq_)) {
                    c.ready_.push_back(std::move(it->second));
                    c.reorder_.erase(it);
                    ++c.expected_seq_;
                }
                c.send_ack_locked(out);
                if (c.remote_fin_seq_ && !c.remote_finished_ &&
                    c.expected_seq_ >= *c.remote_fin_seq_) {
                    c.remote_finished_ = true;
                    CircuitMessage fin_ack;
                    fin_ack.type = CircuitMessageType::FinAck;
                    c.seal_locked(std::move(fin_ack), out);
                }
                c.cv_.notify_all();
                break;
            }

            case CircuitMessageType::Ack: {
                if (c.terminal_locked()) {
                    break;
                }
                std::erase_if(c.in_flight_, [&](const auto& kv) { return kv.first < msg->seq; });
                for (auto seq : msg->sacks) {
                    c.in_flight_.erase(seq);
                }
                c.pump_locked(now, out);
                break;
            }

            case CircuitMessageType::Fin:
                c.remote_fin_seq_ = msg->seq;
                if (c.expected_seq_ >= msg->seq) {
                    c.remote_finished_ = true;
                    CircuitMessage fin_ack;
                    fin_ack.type = CircuitMessageType::FinAck;
                    c.seal_locked(std::move(fin_ack), out);
                }
                c.cv_.notify_all();
                break;

            case CircuitMessageType::FinAck:
                if (c.fin_seq_) {
                    c.fin_acked_ = true;
                    c.cv_.notify_all();
                }
                break;

            case CircuitMessageType::Open:
                break;
        }
    }
    transmit(*circuit, out);
}

void CircuitManager::on_link_down(const NodeId& peer) {
    std::vector<std::shared_ptr<Circuit>> affected;
    {
        std::lock_guard lock(table_mutex_);
        for (const auto& [id, c] : circuits_) {
            if (c->first_hop() == peer) {
                affected.push_back(c);
            }
        }
    }
    for (const auto& c : affected) {
        {
            std::lock_guard lock(c->mutex_);
            c->fail_locked(MixnetError::LinkDown);
        }
        report_closed(*c);
    }
}

void CircuitManager::tick(CircuitClock::time_point now) {
    std::vector<std::shared_ptr<Circuit>> all;
    {
        std::lock_guard lock(table_mutex_);
        all.reserve(circuits_.size());
        for (const auto& [id, c] : circuits_) {
            all.push_back(c);
        }
    }

    for (const auto& circuit : all) {
        auto& c = *circuit;
        Circuit::Outbox out;
        bool report = false;
        bool purge = false;
        {
            std::lock_guard lock(c.mutex_);
            switch (c.state_) {
                case CircuitState::Opening:
                    if (now - c.created_at_ >= config_.open_timeout) {
                        c.fail_locked(MixnetError::CircuitOpenTimeout);
                        report = true;
                    } else if (now - c.open_sent_at_ >= config_.rto) {
                        c.open_sent_at_ = now;
                        CircuitMessage msg;
                        msg.type = CircuitMessageType::Open;
                        msg.initiator = self_;
                        msg.ephemeral = c.ephemeral_;
                        msg.priority = static_cast<uint8_t>(c.priority_);
                        msg.open_signature = c.open_signature_;
                        c.seal_locked(std::move(msg), out);
                    }
                    break;

                case CircuitState::Open:
                case CircuitState::Closing: {
                    std::vector<uint32_t> due;
                    for (const auto& [seq, seg] : c.in_flight_) {
                        if (now - seg.sent_at >= config_.rto) {
                            due.push_back(seq);
                        }
                    }
                    for (auto seq : due) {
                        if (c.terminal_locked()) break;
                        auto& seg = c.in_flight_.at(seq);
                        if (++seg.retries > config_.max_retries) {
                            LOG_INFO("circuit {:016x}: segment {} unacknowledged after {} retries",
                                     c.id_, seq, config_.max_retries);
                            c.fail_locked(MixnetError::RetransmitExhausted);
                            report = true;
                            break;
                        }
                        seg.sent_at = now;
                        CircuitMessage msg;
                        msg.type = CircuitMessageType::Data;
                        msg.seq = seq;
                        msg.data = seg.data;
                        c.seal_locked(std::move(msg), out);
                    }

                    if (!c.terminal_locked() && c.fin_seq_ && !c.fin_acked_ &&
                        now - c.fin_sent_at_ >= config_.rto) {
                        if (++c.fin_retries_ > config_.max_retries) {
                            c.fail_locked(MixnetError::RetransmitExhausted);
                            report = true;
                        } else {
                            c.fin_sent_at_ = now;
                            CircuitMessage msg;
                            msg.type = CircuitMessageType::Fin;
                            msg.seq = *c.fin_seq_;
                            c.seal_locked(std::move(msg), out);
                        }
                    }

                    if (c.state_ == CircuitState::Open && c.in_flight_.empty() &&
                        c.pending_.empty() && now - c.last_activity_ >= config_.idle_timeout) {
                        LOG_DEBUG("circuit {:016x}: idle, closing", c.id_);
                        c.state_ = CircuitState::Closed;
                        c.closed_at_ = now;
                        c.cv_.notify_all();
                        report = true;
                    }
                    break;
                }

                case CircuitState::Closed:
                    purge = now - c.closed_at_ >= config_.linger;
                    break;

                case CircuitState::Failed:
                    purge = true;
                    break;
            }
        }

        transmit(c, out);
        if (report) {
            report_closed(c);
        }
        if (purge) {
            remove(c.id_);
        }
    }
}

std::shared_ptr<Circuit> CircuitManager::find(CircuitId id) const {
    std::lock_guard lock(table_mutex_);
    auto it = circuits_.find(id);
    return it == circuits_.end() ? nullptr : it->second;
}

std::vector<CircuitInfo> CircuitManager::list() const {
    std::vector<std::shared_ptr<Circuit>> all;
    {
        std::lock_guard lock(table_mutex_);
        for (const auto& [id, c] : circuits_) {
            all.push_back(c);
        }
    }

    std::vector<CircuitInfo> out;
    out.reserve(all.size());
    for (const auto& c : all) {
        std::lock_guard lock(c->mutex_);
        out.push_back(CircuitInfo{
            .id = c->id_,
            .state = c->state_,
            .remote = c->remote_,
            .initiator = c->initiator_,
            .hops = c->route_.size(),
            .in_flight = c->in_flight_.size(),
            .buffered = c->pending_.size(),
        });
    }
    std::sort(out.begin(), out.end(),
              [](const CircuitInfo& a, const CircuitInfo& b) { return a.id < b.id; });
    return out;
}

size_t CircuitManager::circuit_count() const {
    std::lock_guard lock(table_mutex_);
    return circuits_.size();
}

}  // namespace mixnet::core
