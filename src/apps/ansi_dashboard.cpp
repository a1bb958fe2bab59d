#include "apps/ansi_dashboard.hpp"

#include <algorithm>
#include <iomanip>
#include <utility>

#include "core/labels/general_labels.hpp"

namespace occ {

static constexpr const char* kReset = "\033[0m";
static constexpr const char* kRed   = "\033[31m";
static constexpr const char* kGreen = "\033[32m";
static constexpr const char* kYellow= "\033[33m";
static constexpr const char* kCyan  = "\033[36m";

static double NsToMs(std::uint64_t ns) { return static_cast<double>(ns) / 1e6; }

// Fill a simple bar based on ratio of used/cap
static std::string Bar(std::size_t used, std::size_t cap, std::size_t width) {
  if (cap == 0) return std::string(width, '.');
  const double frac = std::min(1.0, static_cast<double>(used) / static_cast<double>(cap));

  const std::size_t filled = static_cast<std::size_t>(frac * width);
  std::string s;
  s.reserve(width);
  for (std::size_t i = 0; i < width; ++i) s.push_back(i < filled ? 'I' : '_');
  return s;
}

AnsiDashboard::AnsiDashboard(const Metrics& metrics, std::vector<QueueView> queues, std::ostream& out)
    : metrics_(metrics), queues_(std::move(queues)), out_(out) {}

void AnsiDashboard::draw(const CountSnapshot& snapshot) {
  using namespace std::chrono;

  const auto now = steady_clock::now();
  if (first_) {
    out_ << "\033[2J";
    last_ = now;
    first_ = false;
  }
  const double dt = duration_cast<duration<double>>(now - last_).count();
  last_ = now;

  const auto now_ns = NowNs();

  // Home the cursor and clear below so shrinking sections leave no residue
  out_ << "\033[H\033[J";
  out_ << "OBJECT CROSSING COUNTER    frame " << snapshot.frame_index
       << "    tracks " << snapshot.tracks.size() << "\n\n";

  out_ << std::left
       << std::setw(16) << "STAGE"
       << std::setw(9) << "FPS"
       << std::setw(9) << "DET/s"
       << std::setw(9) << "EVENTS"
       << std::setw(9) << "BUSY%"
       << std::setw(10) << "AVG(ms)"
       << std::setw(10) << "MAX(ms)"
       << std::setw(10) << "LAST(ms)"
       << "\n";
  out_ << std::string(16 + 9 * 4 + 10 * 3, '-') << "\n";

  for (const auto& up : metrics_.stages()) {
    const StageMetrics& m = *up;
    auto& p = prev_stage_[up.get()];

    const auto frames = m.frames.load(std::memory_order_relaxed);
    const double fps = (dt > 0) ? (static_cast<double>(frames - p.frames) / dt) : 0.0;
    p.frames = frames;

    const auto dets = m.detections.load(std::memory_order_relaxed);
    const double det_ps = (dt > 0) ? (static_cast<double>(dets - p.detections) / dt) : 0.0;
    p.detections = dets;

    const auto work = m.work_ns_total.load(std::memory_order_relaxed);
    double busy = (dt > 0) ? static_cast<double>(work - p.work_ns) / (dt * 1e9) : 0.0;
    busy = std::max(0.0, std::min(1.0, busy));
    auto busy_color = (busy > 0.85) ? kRed : (busy > 0.60) ? kYellow : kGreen;
    p.work_ns = work;

    // Time since the stage last finished a frame, 0 until it has finished one
    const auto lf = m.last_frame_ns.load(std::memory_order_relaxed);
    const double last_ms = (lf == 0 || lf > now_ns) ? 0.0 : NsToMs(now_ns - lf);

    out_ << std::left
         << std::setw(16) << m.name
         << std::setw(9) << std::fixed << std::setprecision(1) << fps
         << std::setw(9) << std::fixed << std::setprecision(1) << det_ps
         << std::setw(9) << m.events.load(std::memory_order_relaxed)
         << busy_color << std::setw(9) << std::fixed << std::setprecision(1) << (busy * 100.0) << kReset
         << std::setw(10) << std::fixed << std::setprecision(2) << NsToMs(m.mean_work_ns())
         << std::setw(10) << std::fixed << std::setprecision(2) << NsToMs(m.max_work_ns.load(std::memory_order_relaxed))
         << std::setw(10) << std::fixed << std::setprecision(1) << last_ms
         << "\n";
  }

  out_ << "\nQUEUES\n";
  for (const auto& q : queues_) {
    const auto used = q.size_fn ? q.size_fn() : 0;
    const auto cap  = q.cap_fn ? q.cap_fn() : 0;

    double frac = (cap == 0) ? 0.0 : static_cast<double>(used) / static_cast<double>(cap);
    const char* color = (frac > 0.85) ? kRed : (frac > 0.60) ? kYellow : kGreen;

    std::uint64_t total_drops = q.drops_fn ? q.drops_fn() : 0;
    std::uint64_t& prev_total = prev_qdrops_[q.name];
    const double drop_ps = dt > 0 ? (static_cast<double>(total_drops - prev_total) / dt) : 0.0;
    prev_total = total_drops;

    out_ << "  " << std::setw(22) << std::left << q.name
         << " " << color << used << "/" << cap
         << " [" << Bar(used, cap, 24) << "]" << kReset
         << "  drop/s=" << std::fixed << std::setprecision(1) << drop_ps
         << "\n";
  }

  out_ << "\nLINES\n";
  if (snapshot.lines.empty()) out_ << "  (none)\n";
  for (const auto& l : snapshot.lines) {
    const LineCount t = l.total();
    out_ << "  " << kCyan << std::setw(20) << std::left << l.name << kReset
         << " in=" << std::setw(6) << t.in << " out=" << std::setw(6) << t.out
         << " total=" << (t.in + t.out) << "\n";
    for (const auto& kv : l.per_class) {
      out_ << "      " << std::setw(16) << GeneralClassName(kv.first)
           << " in=" << std::setw(6) << kv.second.in << " out=" << kv.second.out << "\n";
    }
  }

  out_ << "\nZONES\n";
  if (snapshot.zones.empty()) out_ << "  (none)\n";
  for (const auto& z : snapshot.zones) {
    const ZoneCount t = z.total();
    out_ << "  " << kCyan << std::setw(20) << std::left << z.name << kReset
         << " inside=" << std::setw(4) << t.currently_inside
         << " entered=" << std::setw(6) << t.entries << " exited=" << t.exits << "\n";
    for (const auto& kv : z.per_class) {
      out_ << "      " << std::setw(16) << GeneralClassName(kv.first)
           << " inside=" << std::setw(4) << kv.second.currently_inside
           << " entered=" << kv.second.entries << "\n";
    }
  }

  out_ << "\n" << std::flush;
}

} // namespace occ
