#include "LightsOut.h"

#include <chrono>
#include <exception>

// ===== TASK SCHEDULER =====
//
// Polled schedule table: tick(now) fires whatever is due. Callbacks always run outside jobsMutex so they may schedule or
// cancel jobs themselves.

TaskScheduler::TaskScheduler(int tickMs)
  : nextJobId(1), running(false), tickMs(tickMs) {}

TaskScheduler::~TaskScheduler() {
  end();
}

time_t TaskScheduler::nextOccurrence(const RecurringSpec& spec, time_t after) {
  for (int offset = 0; offset <= 7; offset++) {
    time_t day = addLocalDays(after, offset);
    time_t candidate = localTimeAt(day, spec.hour, spec.minute);
    if (candidate <= after) continue;
    if (weekdayAllowed(spec.weekdays, mondayWeekday(candidate))) return candidate;
  }
  return 0;
}

int TaskScheduler::scheduleRecurring(const RecurringSpec& spec, TaskCallback callback, time_t now) {
  time_t first = nextOccurrence(spec, now);
  if (first == 0) {
    DEBUG_ERROR(SCHEDULER, "No occurrence for recurring job at " + std::to_string(spec.hour) + ":" + std::to_string(spec.minute));
    return -1;
  }

  std::lock_guard<std::mutex> lock(jobsMutex);
  Job job;
  job.id = nextJobId++;
  job.kind = JOB_RECURRING;
  job.spec = spec;
  job.nextRun = first;
  job.callback = callback;
  jobs[job.id] = job;
  DEBUG_VERBOSE(SCHEDULER, "Recurring job " + std::to_string(job.id) + " first run " + formatTimestamp(first));
  return job.id;
}

int TaskScheduler::scheduleInterval(int seconds, TaskCallback callback, time_t now) {
  if (seconds <= 0) return -1;

  std::lock_guard<std::mutex> lock(jobsMutex);
  Job job;
  job.id = nextJobId++;
  job.kind = JOB_INTERVAL;
  job.intervalSeconds = seconds;
  job.nextRun = now + seconds;
  job.callback = callback;
  jobs[job.id] = job;
  return job.id;
}

int TaskScheduler::scheduleOnce(time_t when, TaskCallback callback) {
  std::lock_guard<std::mutex> lock(jobsMutex);
  Job job;
  job.id = nextJobId++;
  job.kind = JOB_ONCE;
  job.nextRun = when;
  job.callback = callback;
  jobs[job.id] = job;
  DEBUG_VERBOSE(SCHEDULER, "One-shot job " + std::to_string(job.id) + " at " + formatTimestamp(when));
  return job.id;
}

bool TaskScheduler::cancel(int jobId) {
  std::lock_guard<std::mutex> lock(jobsMutex);
  return jobs.erase(jobId) > 0;
}

void TaskScheduler::cancelAll() {
  std::lock_guard<std::mutex> lock(jobsMutex);
  jobs.clear();
}

time_t TaskScheduler::nextRunTime(int jobId) const {
  std::lock_guard<std::mutex> lock(jobsMutex);
  std::map<int, Job>::const_iterator it = jobs.find(jobId);
  return it == jobs.end() ? 0 : it->second.nextRun;
}

size_t TaskScheduler::jobCount() const {
  std::lock_guard<std::mutex> lock(jobsMutex);
  return jobs.size();
}

int TaskScheduler::tick(time_t now) {
  std::vector<std::pair<int, TaskCallback> > due;

  {
    std::lock_guard<std::mutex> lock(jobsMutex);
    std::map<int, Job>::iterator it = jobs.begin();
    while (it != jobs.end()) {
      Job& job = it->second;
      if (job.nextRun > now) {
        ++it;
        continue;
      }

      due.push_back(std::make_pair(job.id, job.callback));

      if (job.kind == JOB_ONCE) {
        it = jobs.erase(it);
        continue;
      }

      if (job.kind == JOB_INTERVAL) {
        while (job.nextRun <= now) job.nextRun += job.intervalSeconds;
      } else {
        job.nextRun = nextOccurrence(job.spec, now);
        if (job.nextRun == 0) {
          it = jobs.erase(it);
          continue;
        }
      }
      ++it;
    }
  }

  for (size_t i = 0; i < due.size(); i++) {
    try {
      due[i].second();
    } catch (const std::exception& e) {
      DEBUG_ERROR(SCHEDULER, "Job " + std::to_string(due[i].first) + " failed: " + e.what());
    }
  }

  return static_cast<int>(due.size());
}

void TaskScheduler::begin() {
  if (running) return;
  running = true;
  worker = std::thread(&TaskScheduler::workerLoop, this);
  DEBUG_INFO(SCHEDULER, "Task scheduler started");
}

void TaskScheduler::end() {
  if (!running) return;
  {
    std::lock_guard<std::mutex> lock(wakeMutex);
    running = false;
  }
  wakeSignal.notify_all();
  if (worker.joinable()) worker.join();
  DEBUG_INFO(SCHEDULER, "Task scheduler stopped");
}

void TaskScheduler::workerLoop() {
  while (running) {
    tick(time(nullptr));

    std::unique_lock<std::mutex> lock(wakeMutex);
    wakeSignal.wait_for(lock, std::chrono::milliseconds(tickMs), [this] { return !running; });
  }
}
