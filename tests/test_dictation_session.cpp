#include <gtest/gtest.h>
#include "session/DictationSession.hpp"
#include "stt/LocalSttEngine.hpp"
#include "TestFakes.hpp"

TEST(TranscriptTest, PartialReplacesPartial) {
    Transcript t;
    t.apply(SttEvent::makePartial("hel"));
    t.apply(SttEvent::makePartial("hello"));
    EXPECT_EQ(t.partialText(), "hello");
    EXPECT_EQ(t.text(), "hello");
}

TEST(TranscriptTest, FinalAppendsWithSingleSpaceAndClearsPartial) {
    Transcript t;
    t.apply(SttEvent::makeFinal("Bonjour."));
    t.apply(SttEvent::makePartial("comment"));
    t.apply(SttEvent::makeFinal("Comment ça va ?"));

    EXPECT_EQ(t.finalText(), "Bonjour. Comment ça va ?");
    EXPECT_TRUE(t.partialText().empty());
}

TEST(TranscriptTest, TextJoinsFinalsAndPendingPartial) {
    Transcript t;
    t.apply(SttEvent::makeFinal("one"));
    t.apply(SttEvent::makePartial("two "));
    EXPECT_EQ(t.text(), "one two");

    t.clear();
    EXPECT_TRUE(t.empty());
    EXPECT_EQ(t.text(), "");
}

class DictationSessionTest : public ::testing::Test {
protected:
    std::unique_ptr<DictationSession> makeSession(AppConfig config = {}) {
        auto engine = engine_;
        auto built  = built_;
        return std::make_unique<DictationSession>(
            config,
            [engine, built](const AppConfig& c) -> std::unique_ptr<ISttEngine> {
                if (c.openaiApiKey.empty())
                    throw SttError(SttError::Kind::ModelNotFound,
                                   "OpenAI Whisper API key required");
                (*built)++;
                return std::make_unique<FakeEngine>(engine);
            },
            scriptedCaptureFactory(capture_));
    }

    static AppConfig keyed() {
        AppConfig c;
        c.openaiApiKey = "sk-test";
        return c;
    }

    std::shared_ptr<EngineProbe>  engine_  = std::make_shared<EngineProbe>();
    std::shared_ptr<CaptureProbe> capture_ = std::make_shared<CaptureProbe>();
    std::shared_ptr<int>          built_   = std::make_shared<int>(0);
};

TEST_F(DictationSessionTest, PipelineIsCreatedLazily) {
    auto s = makeSession(keyed());
    EXPECT_FALSE(s->hasPipeline());
    EXPECT_FALSE(s->isRecording());

    s->startRecording();
    EXPECT_TRUE(s->hasPipeline());
    EXPECT_TRUE(s->isRecording());
    EXPECT_EQ(*built_, 1);

    s->stopRecording();
    s->startRecording();
    EXPECT_EQ(*built_, 1);   // reused
    s->stopRecording();
}

TEST_F(DictationSessionTest, MissingKeySurfacesAsSttError) {
    auto s = makeSession();
    try {
        s->startRecording();
        FAIL() << "expected PipelineError";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.kind(), PipelineError::Kind::Stt);
        EXPECT_NE(std::string(e.what()).find("API key required"), std::string::npos);
    }
    EXPECT_FALSE(s->isRecording());
    EXPECT_FALSE(s->hasPipeline());
}

TEST_F(DictationSessionTest, StopReturnsFinalsAndPartials) {
    engine_->onPush.push_back(SttEvent::makeFinal("Hello"));
    engine_->onFlush.push_back(SttEvent::makeFinal("world"));

    std::vector<SttEvent> seen;
    std::mutex seenMtx;
    auto s = makeSession(keyed());
    s->setEventCallback([&](const SttEvent& e) {
        std::lock_guard lock(seenMtx);
        seen.push_back(e);
    });

    s->startRecording(Language(Language::Id::English));
    capture_->feed(std::vector<float>(160, 0.1f));
    EXPECT_TRUE(waitFor([&] { return s->transcript().finalText() == "Hello"; }));

    EXPECT_EQ(s->stopRecording(), "Hello world");
    EXPECT_FALSE(s->isRecording());

    std::lock_guard lock(seenMtx);
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[1], SttEvent::makeFinal("world"));
}

TEST_F(DictationSessionTest, SecondStartLeavesRecordingIntact) {
    engine_->onPush.push_back(SttEvent::makeFinal("first"));
    engine_->onPush.push_back(SttEvent::makeFinal("second"));

    auto s = makeSession(keyed());
    s->startRecording(Language(Language::Id::English));
    capture_->feed(std::vector<float>(160, 0.1f));
    ASSERT_TRUE(waitFor([&] { return s->transcript().finalText() == "first"; }));

    try {
        s->startRecording(Language(Language::Id::German));
        FAIL() << "expected PipelineError";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.kind(), PipelineError::Kind::AlreadyRunning);
    }
    EXPECT_TRUE(s->isRecording());
    {
        std::lock_guard lock(engine_->mtx);
        EXPECT_EQ(engine_->language, Language(Language::Id::English));
    }

    capture_->feed(std::vector<float>(160, 0.1f));
    EXPECT_TRUE(waitFor([&] {
        return s->transcript().finalText() == "first second";
    }));
    EXPECT_EQ(s->stopRecording(), "first second");
    EXPECT_EQ(capture_->startCount(), 1);
}

TEST_F(DictationSessionTest, LanguageDefaultsToConfig) {
    AppConfig c = keyed();
    c.language = "fr";
    auto s = makeSession(c);
    s->startRecording();
    {
        std::lock_guard lock(engine_->mtx);
        EXPECT_EQ(engine_->language, Language(Language::Id::French));
    }
    s->stopRecording();
}

TEST_F(DictationSessionTest, StartClearsPreviousTranscript) {
    engine_->onFlush.push_back(SttEvent::makeFinal("first"));
    auto s = makeSession(keyed());
    s->startRecording();
    EXPECT_EQ(s->stopRecording(), "first");

    s->startRecording();
    EXPECT_TRUE(s->transcript().empty());
    EXPECT_EQ(s->stopRecording(), "");
}

TEST_F(DictationSessionTest, CancelDiscardsText) {
    engine_->onFlush.push_back(SttEvent::makeFinal("secret"));
    auto s = makeSession(keyed());
    s->startRecording();
    s->cancelRecording();

    EXPECT_FALSE(s->isRecording());
    EXPECT_TRUE(s->transcript().empty());
}

TEST_F(DictationSessionTest, EngineChangeDropsPipeline) {
    auto s = makeSession(keyed());
    s->startRecording();
    s->stopRecording();

    AppConfig c = s->config();
    c.reformulate = true;            // not engine related
    s->applyConfig(c);
    EXPECT_TRUE(s->hasPipeline());

    c.sttEngine = "gemini";
    s->applyConfig(c);
    EXPECT_FALSE(s->hasPipeline());
    EXPECT_EQ(s->config().sttEngine, "gemini");

    s->startRecording();
    EXPECT_EQ(*built_, 2);
    s->stopRecording();
}

TEST_F(DictationSessionTest, ApplyConfigWhileRecordingStopsIt) {
    auto s = makeSession(keyed());
    s->startRecording();

    AppConfig c = s->config();
    c.openaiApiKey = "sk-other";
    s->applyConfig(c);

    EXPECT_FALSE(s->isRecording());
    EXPECT_EQ(capture_->stopCount(), 1);
}

TEST_F(DictationSessionTest, CaptureFailureLeavesSessionIdle) {
    capture_->failNextStart = true;
    auto s = makeSession(keyed());
    EXPECT_THROW(s->startRecording(), PipelineError);
    EXPECT_FALSE(s->isRecording());
    EXPECT_TRUE(s->pipelineStatus().is(PipelineStatus::State::Error));

    s->startRecording();
    EXPECT_TRUE(s->isRecording());
    s->stopRecording();
}

TEST_F(DictationSessionTest, StartAfterCaptureDiedRestarts) {
    auto s = makeSession(keyed());
    s->startRecording();
    capture_->fail("device unplugged");
    ASSERT_TRUE(s->pipelineStatus().is(PipelineStatus::State::Error));

    s->startRecording();
    EXPECT_TRUE(s->isRecording());
    EXPECT_EQ(capture_->startCount(), 2);
    s->stopRecording();
}

TEST(DictationSessionLocalTest, ChunkedLocalTranscriptionKeepsWholeText) {
    auto backend = std::make_shared<FakeBackend>();
    backend->reply("one");
    backend->reply("two");
    backend->reply("three");

    auto capture = std::make_shared<CaptureProbe>();
    DictationSession s(
        AppConfig{},
        [backend](const AppConfig&) -> std::unique_ptr<ISttEngine> {
            DispatchPolicy policy = LocalSttEngine::localPolicy();
            policy.autoDispatchSamples = 16000;
            return std::make_unique<LocalSttEngine>("model.bin", "Whisper",
                                                    backend, policy);
        },
        scriptedCaptureFactory(capture));

    s.startRecording();
    capture->feed(std::vector<float>(16000, 0.1f));
    ASSERT_TRUE(waitFor([&] { return s.transcript().partialText() == "one"; }));
    capture->feed(std::vector<float>(16000, 0.1f));
    ASSERT_TRUE(waitFor([&] { return s.transcript().partialText() == "one two"; }));
    capture->feed(std::vector<float>(4000, 0.1f));

    EXPECT_EQ(s.stopRecording(), "one two three");
    EXPECT_EQ(backend->callCount(), 3u);
}
