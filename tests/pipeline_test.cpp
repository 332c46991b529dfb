/*
 * audioscribe - Queued Audio Transcription
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "audioscribe/pipeline.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "test_support.hpp"

using audioscribe::Config;
using audioscribe::EnqueueError;
using audioscribe::InitState;
using audioscribe::Job;
using audioscribe::JobError;
using audioscribe::Observer;
using audioscribe::OutputChannel;
using audioscribe::Pipeline;
using audioscribe::RunnerState;
using audioscribe::Status;
using audioscribe::TranscribeResult;
using audioscribe::testing::eventually;
using audioscribe::testing::FakeTranscriber;
using audioscribe::testing::readFile;
using audioscribe::testing::TempDir;
using namespace std::chrono_literals;

namespace {

struct Event {
  enum class Kind { Job, Progress };
  Kind kind;
  std::string name;
  Status status = Status::Pending;
  double value = 0.0;
};

class PipelineTest : public ::testing::Test {
protected:
  void TearDown() override {
    engine_.releaseLoad();
    if (pipeline_) {
      pipeline_->shutdown();
      pipeline_.reset();
    }
  }

  Pipeline& make(const std::function<void(Config&)>& tweak = {}) {
    Config config;
    config.monitorInterval = 5ms;
    config.readinessPoll = 10ms;
    if (tweak) {
      tweak(config);
    }

    Observer observer;
    observer.onProgress = [this](double v) {
      std::lock_guard<std::mutex> lock(mutex_);
      events_.push_back({Event::Kind::Progress, "", Status::Pending, v});
    };
    observer.onStatus = [this](const std::string& text) {
      std::lock_guard<std::mutex> lock(mutex_);
      statuses_.push_back(text);
    };
    observer.onError = [this](const std::string& text) {
      std::lock_guard<std::mutex> lock(mutex_);
      errors_.push_back(text);
    };
    observer.onJobChanged = [this](const Job& job) {
      std::lock_guard<std::mutex> lock(mutex_);
      events_.push_back({Event::Kind::Job, std::filesystem::path(job.path).filename().string(), job.status});
    };

    pipeline_ = std::make_unique<Pipeline>(engine_, observer, config);
    return *pipeline_;
  }

  std::vector<Event> events() {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
  }
  std::vector<std::string> statuses() {
    std::lock_guard<std::mutex> lock(mutex_);
    return statuses_;
  }
  std::vector<std::string> errors() {
    std::lock_guard<std::mutex> lock(mutex_);
    return errors_;
  }

  // Position of the job event, or npos.
  std::size_t indexOf(const std::string& name, Status status) {
    auto log = events();
    for (std::size_t i = 0; i < log.size(); ++i) {
      if (log[i].kind == Event::Kind::Job && log[i].name == name && log[i].status == status) {
        return i;
      }
    }
    return std::string::npos;
  }

  bool anyContains(const std::vector<std::string>& lines, const std::string& needle) {
    return std::any_of(lines.begin(), lines.end(),
                       [&needle](const std::string& line) { return line.find(needle) != std::string::npos; });
  }

  static TranscribeResult ok(const std::string& text) {
    TranscribeResult result;
    result.ok = true;
    result.text = text;
    return result;
  }

  TempDir dir_;
  FakeTranscriber engine_;
  std::unique_ptr<Pipeline> pipeline_;

  std::mutex mutex_;
  std::vector<Event> events_;
  std::vector<std::string> statuses_;
  std::vector<std::string> errors_;
};

TEST_F(PipelineTest, QueuedJobsWaitForModelThenRunInOrder) {
  auto& pipeline = make();
  ASSERT_TRUE(pipeline.start());

  auto x = dir_.touch("x.mp3");
  auto y = dir_.touch("y.wav");
  ASSERT_TRUE(pipeline.enqueue(x.string()).ok);
  ASSERT_TRUE(pipeline.enqueue(y.string()).ok);

  std::this_thread::sleep_for(60ms);
  EXPECT_TRUE(engine_.calls().empty());
  EXPECT_EQ(pipeline.initState(), InitState::Loading);
  EXPECT_EQ(pipeline.runnerState(), RunnerState::WaitingForReadiness);
  EXPECT_EQ(pipeline.pending().size(), 2u);

  engine_.releaseLoad();
  ASSERT_TRUE(pipeline.waitIdle(10s));

  auto history = pipeline.history();
  ASSERT_EQ(history.size(), 2u);
  EXPECT_EQ(history[0].path, x.string());
  EXPECT_EQ(history[0].status, Status::Done);
  EXPECT_EQ(history[1].path, y.string());
  EXPECT_EQ(history[1].status, Status::Done);
  EXPECT_EQ(engine_.calls(), (std::vector<std::string>{x.string(), y.string()}));

  EXPECT_EQ(readFile(dir_.path() / "x_transcript.txt"), "Audio transcription:\n\ntext of x");
  EXPECT_EQ(readFile(dir_.path() / "y_transcript.txt"), "Audio transcription:\n\ntext of y");

  EXPECT_LT(indexOf("x.mp3", Status::Pending), indexOf("x.mp3", Status::Running));
  EXPECT_LT(indexOf("x.mp3", Status::Running), indexOf("x.mp3", Status::Done));
  EXPECT_LT(indexOf("x.mp3", Status::Done), indexOf("y.wav", Status::Running));
  EXPECT_NE(indexOf("y.wav", Status::Done), std::string::npos);

  auto status = statuses();
  ASSERT_FALSE(status.empty());
  EXPECT_EQ(status.front(), "Initializing model...");
  EXPECT_TRUE(anyContains(status, "Ready"));
  EXPECT_TRUE(anyContains(status, "Processing: x.mp3"));
  EXPECT_TRUE(anyContains(status, "Transcription complete: x.mp3 -> x_transcript.txt"));
  EXPECT_EQ(pipeline.initState(), InitState::Ready);
  EXPECT_EQ(pipeline.failedCount(), 0u);
}

TEST_F(PipelineTest, JobsQueuedBeforeStartRunAfterStart) {
  auto& pipeline = make();
  auto x = dir_.touch("early.wav");
  ASSERT_TRUE(pipeline.enqueue(x.string()).ok);

  ASSERT_TRUE(pipeline.start());
  engine_.releaseLoad();
  ASSERT_TRUE(pipeline.waitIdle(10s));

  auto history = pipeline.history();
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0].status, Status::Done);
}

TEST_F(PipelineTest, FailedJobDoesNotStopLaterJobs) {
  engine_.setBehavior([](const std::filesystem::path& p) -> TranscribeResult {
    if (p.stem() == "x") {
      throw std::runtime_error("decoder blew up");
    }
    return ok("fine");
  });
  auto& pipeline = make();
  ASSERT_TRUE(pipeline.start());
  engine_.releaseLoad();

  ASSERT_TRUE(pipeline.enqueue(dir_.touch("x.wav").string()).ok);
  ASSERT_TRUE(pipeline.enqueue(dir_.touch("y.wav").string()).ok);
  ASSERT_TRUE(pipeline.waitIdle(10s));

  auto history = pipeline.history();
  ASSERT_EQ(history.size(), 2u);
  EXPECT_EQ(history[0].status, Status::Failed);
  EXPECT_NE(history[0].error.find("decoder blew up"), std::string::npos);
  EXPECT_EQ(history[0].errorKind, JobError::Engine);
  EXPECT_EQ(history[1].status, Status::Done);
  EXPECT_EQ(history[1].errorKind, JobError::None);

  EXPECT_FALSE(std::filesystem::exists(dir_.path() / "x_transcript.txt"));
  EXPECT_TRUE(std::filesystem::exists(dir_.path() / "y_transcript.txt"));
  EXPECT_TRUE(anyContains(errors(), "decoder blew up"));
  EXPECT_EQ(pipeline.failedCount(), 1u);
}

TEST_F(PipelineTest, EngineErrorResultFailsJob) {
  engine_.setBehavior([](const std::filesystem::path&) {
    TranscribeResult result;
    result.error = "unreadable audio";
    return result;
  });
  auto& pipeline = make();
  ASSERT_TRUE(pipeline.start());
  engine_.releaseLoad();

  ASSERT_TRUE(pipeline.enqueue(dir_.touch("x.wav").string()).ok);
  ASSERT_TRUE(pipeline.waitIdle(10s));

  auto history = pipeline.history();
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0].status, Status::Failed);
  EXPECT_NE(history[0].error.find("unreadable audio"), std::string::npos);
  EXPECT_TRUE(anyContains(statuses(), "Error: "));
}

TEST_F(PipelineTest, AtMostOneJobRunsAtATime) {
  engine_.setBehavior([](const std::filesystem::path& p) {
    std::this_thread::sleep_for(10ms);
    return ok(p.stem().string());
  });
  auto& pipeline = make();
  ASSERT_TRUE(pipeline.start());
  engine_.releaseLoad();

  std::vector<std::string> queued;
  for (int i = 0; i < 5; ++i) {
    auto file = dir_.touch("clip" + std::to_string(i) + ".wav").string();
    queued.push_back(file);
    ASSERT_TRUE(pipeline.enqueue(file).ok);
  }
  ASSERT_TRUE(pipeline.waitIdle(10s));

  EXPECT_EQ(engine_.maxActive(), 1);
  EXPECT_EQ(engine_.calls(), queued);
  for (const auto& job : pipeline.history()) {
    EXPECT_EQ(job.status, Status::Done);
  }
}

TEST_F(PipelineTest, ProgressReachesObserverAndSettlesOnLastValue) {
  engine_.setBehavior([](const std::filesystem::path&) {
    auto& channel = OutputChannel::instance();
    channel.write("whisper_full: progress =  10%\n");
    std::this_thread::sleep_for(40ms);
    channel.write("whisper_full: progress =  55%\n");
    std::this_thread::sleep_for(40ms);
    channel.write("whisper_full: progress =  42%\n");
    std::this_thread::sleep_for(60ms);
    return ok("done");
  });
  auto& pipeline = make();
  ASSERT_TRUE(pipeline.start());
  engine_.releaseLoad();

  ASSERT_TRUE(pipeline.enqueue(dir_.touch("x.wav").string()).ok);
  ASSERT_TRUE(pipeline.waitIdle(10s));

  std::vector<double> values;
  for (const auto& e : events()) {
    if (e.kind == Event::Kind::Progress) {
      values.push_back(e.value);
    }
  }
  ASSERT_FALSE(values.empty());
  EXPECT_DOUBLE_EQ(values.back(), 0.42);
  EXPECT_NE(std::find(values.begin(), values.end(), 0.55), values.end());
  for (double v : values) {
    EXPECT_TRUE(v == 0.0 || v == 0.10 || v == 0.55 || v == 0.42) << v;
  }
  EXPECT_DOUBLE_EQ(pipeline.lastProgress(), 0.42);
}

TEST_F(PipelineTest, ProgressNeverLeaksIntoNextJob) {
  engine_.setBehavior([](const std::filesystem::path& p) {
    if (p.stem() == "x") {
      OutputChannel::instance().write(" 90%\n");
    }
    std::this_thread::sleep_for(40ms);
    return ok("text");
  });
  auto& pipeline = make();
  ASSERT_TRUE(pipeline.start());
  engine_.releaseLoad();

  ASSERT_TRUE(pipeline.enqueue(dir_.touch("x.wav").string()).ok);
  ASSERT_TRUE(pipeline.enqueue(dir_.touch("y.wav").string()).ok);
  ASSERT_TRUE(pipeline.waitIdle(10s));

  auto log = events();
  auto xDone = indexOf("x.wav", Status::Done);
  ASSERT_NE(xDone, std::string::npos);
  bool sawX = false;
  for (std::size_t i = 0; i < log.size(); ++i) {
    if (log[i].kind != Event::Kind::Progress || log[i].value != 0.9) {
      continue;
    }
    sawX = true;
    EXPECT_LT(i, xDone);
  }
  EXPECT_TRUE(sawX);
}

TEST_F(PipelineTest, TranscriptWriteFailureFailsJob) {
  auto& pipeline = make();
  ASSERT_TRUE(pipeline.start());
  engine_.releaseLoad();

  std::filesystem::create_directories(dir_.path() / "x_transcript.txt" / "blocker");
  ASSERT_TRUE(pipeline.enqueue(dir_.touch("x.wav").string()).ok);
  ASSERT_TRUE(pipeline.waitIdle(10s));

  auto history = pipeline.history();
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0].status, Status::Failed);
  EXPECT_NE(history[0].error.find("Failed to save transcript"), std::string::npos);
  EXPECT_EQ(history[0].errorKind, JobError::Persistence);
}

TEST_F(PipelineTest, ModelLoadFailureFailsQueuedJobsAndRejectsNewOnes) {
  auto& pipeline = make();
  ASSERT_TRUE(pipeline.start());
  ASSERT_TRUE(pipeline.enqueue(dir_.touch("x.wav").string()).ok);

  engine_.releaseLoad("missing model file");
  ASSERT_TRUE(eventually([&] { return pipeline.initState() == InitState::Failed; }));
  ASSERT_TRUE(pipeline.waitIdle(10s));

  auto history = pipeline.history();
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0].status, Status::Failed);
  EXPECT_EQ(history[0].error, "model unavailable");
  EXPECT_EQ(history[0].errorKind, JobError::Unavailable);
  EXPECT_TRUE(engine_.calls().empty());
  EXPECT_TRUE(anyContains(errors(), "Model initialization failed: missing model file"));

  auto late = pipeline.enqueue(dir_.touch("y.wav").string());
  EXPECT_FALSE(late.ok);
  EXPECT_EQ(late.error, EnqueueError::Unavailable);
  EXPECT_TRUE(pipeline.pending().empty());
}

TEST_F(PipelineTest, DuplicateOfRunningJobIsIgnored) {
  std::promise<void> finish;
  std::shared_future<void> finished = finish.get_future().share();
  engine_.setBehavior([finished](const std::filesystem::path&) {
    finished.wait();
    return ok("once");
  });
  auto& pipeline = make();
  ASSERT_TRUE(pipeline.start());
  engine_.releaseLoad();

  auto x = dir_.touch("x.wav").string();
  ASSERT_TRUE(pipeline.enqueue(x).ok);
  ASSERT_TRUE(eventually([&] { return pipeline.current().has_value(); }));

  auto again = pipeline.enqueue(x);
  EXPECT_TRUE(again.ok);
  EXPECT_TRUE(again.duplicate);
  EXPECT_TRUE(pipeline.pending().empty());

  finish.set_value();
  ASSERT_TRUE(pipeline.waitIdle(10s));
  EXPECT_EQ(pipeline.history().size(), 1u);
  EXPECT_EQ(engine_.calls().size(), 1u);
}

TEST_F(PipelineTest, ShutdownDropsPendingJobsWhileLoading) {
  auto& pipeline = make();
  ASSERT_TRUE(pipeline.start());
  ASSERT_TRUE(pipeline.enqueue(dir_.touch("x.wav").string()).ok);

  std::thread releaser([this] {
    std::this_thread::sleep_for(50ms);
    engine_.releaseLoad();
  });
  pipeline.shutdown();
  releaser.join();

  EXPECT_FALSE(pipeline.isRunning());
  EXPECT_TRUE(engine_.calls().empty());
  EXPECT_TRUE(pipeline.history().empty());
  EXPECT_TRUE(pipeline.pending().empty());
}

TEST_F(PipelineTest, RejectedEnqueueIsReported) {
  auto& pipeline = make();
  ASSERT_TRUE(pipeline.start());

  auto missing = (dir_.path() / "missing.wav").string();
  auto result = pipeline.enqueue(missing);
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error, EnqueueError::FileNotFound);
  EXPECT_TRUE(anyContains(errors(), "missing.wav"));
  EXPECT_TRUE(anyContains(statuses(), "Error: File not found"));
  EXPECT_TRUE(pipeline.pending().empty());
}

TEST_F(PipelineTest, DropListQueuesEveryPath) {
  auto& pipeline = make();
  auto spaced = dir_.touch("my talk.wav");
  auto plain = dir_.touch("plain.mp3");

  auto results = pipeline.enqueueDropList("{" + spaced.string() + "} " + plain.string());
  ASSERT_EQ(results.size(), 2u);
  EXPECT_TRUE(results[0].ok);
  EXPECT_TRUE(results[1].ok);
  EXPECT_EQ(pipeline.pending().size(), 2u);
}

TEST_F(PipelineTest, ObserverMayReadQueueFromJobCallbacks) {
  Config config;
  config.monitorInterval = 5ms;
  config.readinessPoll = 10ms;

  Pipeline* self = nullptr;
  std::mutex seenMutex;
  std::vector<std::size_t> pendingSeen;
  Observer observer;
  observer.onJobChanged = [&](const Job& job) {
    auto queued = self->pending();
    auto running = self->current();
    std::lock_guard<std::mutex> lock(seenMutex);
    if (job.status == Status::Pending) {
      pendingSeen.push_back(queued.size());
    }
    (void)running;
  };
  pipeline_ = std::make_unique<Pipeline>(engine_, observer, config);
  self = pipeline_.get();
  ASSERT_TRUE(pipeline_->start());
  engine_.releaseLoad();

  auto file = dir_.touch("a.wav").string();
  auto pending = std::async(std::launch::async, [&] { return pipeline_->enqueue(file); });
  ASSERT_EQ(pending.wait_for(5s), std::future_status::ready);
  EXPECT_TRUE(pending.get().ok);
  ASSERT_TRUE(pipeline_->waitIdle(10s));

  std::lock_guard<std::mutex> lock(seenMutex);
  ASSERT_EQ(pendingSeen.size(), 1u);
  EXPECT_EQ(pendingSeen[0], 1u);
}

TEST_F(PipelineTest, HistoryKeepsOnlyTheNewestRecords) {
  auto& pipeline = make([](Config& config) { config.historyLimit = 2; });
  ASSERT_TRUE(pipeline.start());
  engine_.releaseLoad();

  auto a = dir_.touch("a.wav");
  auto b = dir_.touch("b.wav");
  auto c = dir_.touch("c.wav");
  ASSERT_TRUE(pipeline.enqueue(a.string()).ok);
  ASSERT_TRUE(pipeline.enqueue(b.string()).ok);
  ASSERT_TRUE(pipeline.enqueue(c.string()).ok);
  ASSERT_TRUE(pipeline.waitIdle(10s));

  auto history = pipeline.history();
  ASSERT_EQ(history.size(), 2u);
  EXPECT_EQ(history[0].path, b.string());
  EXPECT_EQ(history[1].path, c.string());
  EXPECT_EQ(engine_.calls().size(), 3u);
}

TEST_F(PipelineTest, LoadedModelIsNotLoadedAgain) {
  engine_.releaseLoad();
  {
    auto& first = make();
    ASSERT_TRUE(first.start());
    ASSERT_TRUE(eventually([&first] { return first.initState() == InitState::Ready; }));
    first.shutdown();
  }
  EXPECT_EQ(engine_.loadCount(), 1);

  auto& second = make();
  ASSERT_TRUE(second.start());
  ASSERT_TRUE(eventually([&second] { return second.initState() == InitState::Ready; }));
  ASSERT_TRUE(second.enqueue(dir_.touch("again.wav").string()).ok);
  ASSERT_TRUE(second.waitIdle(10s));

  EXPECT_EQ(engine_.loadCount(), 1);
  ASSERT_EQ(second.history().size(), 1u);
  EXPECT_EQ(second.history()[0].status, Status::Done);
}

}
