#include <chregistry/runtime/app.h>

#include <chregistry/core/log.h>

#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <thread>

namespace chregistry {
namespace {

std::size_t ResolveIoThreads(std::size_t requested) {
    if (requested != 0) {
        return requested;
    }
    auto hc = static_cast<std::size_t>(std::thread::hardware_concurrency());
    return hc == 0 ? static_cast<std::size_t>(1) : hc;
}

} // namespace

App::App(AppOptions options)
    : options_(std::move(options)),
      io_("io", ResolveIoThreads(options_.io_threads)) {
    chregistry::log::Init(options_.log_level);
}

App::~App() {
    Stop();
}

IoContextPool& App::Io() {
    return io_;
}

void App::AddService(std::shared_ptr<IService> service) {
    services_.push_back(std::move(service));
}

int App::Run() {
    {
        std::lock_guard<std::mutex> lk(stop_mu_);
        stopped_ = false;
    }
    stop_requested_.store(false, std::memory_order_release);

    // Keep the signal_set alive by capturing it.
    auto signals = std::make_shared<boost::asio::signal_set>(io_.Next(), SIGINT, SIGTERM);
    signals->async_wait([this, signals](const boost::system::error_code& ec, int signo) {
        if (ec) {
            return;
        }
        chregistry::log::info("Received signal {}", signo);
        // Stop() joins the io threads, so it must not run on one of them.
        std::thread([this] { this->Stop(); }).detach();
    });

    io_.Start();

    for (auto& s : services_) {
        chregistry::log::info("Starting {}", s->Name());
        s->Start();
    }

    {
        std::unique_lock<std::mutex> lk(stop_mu_);
        stop_cv_.wait(lk, [&] { return stopped_; });
    }

    return 0;
}

void App::Stop() {
    // idempotent
    if (stop_requested_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    chregistry::log::info("Stopping registry...");
    for (auto it = services_.rbegin(); it != services_.rend(); ++it) {
        (*it)->Stop();
        chregistry::log::info("Stopped {}", (*it)->Name());
    }
    io_.Stop();
    chregistry::log::info("Stopped.");

    // Notify under the lock: Run() may return and destroy the App right after.
    std::lock_guard<std::mutex> lk(stop_mu_);
    stopped_ = true;
    stop_cv_.notify_all();
}

} // namespace chregistry
