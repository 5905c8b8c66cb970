/**
 * @file test_submission_validator.cpp
 * @brief Тесты проверки результатов воркеров
 */

#include <gtest/gtest.h>

#include "mock_daemon.hpp"
#include "mining/submission_validator.hpp"

#include <memory>
#include <optional>
#include <variant>

namespace xmrweb::tests {

using namespace std::chrono_literals;

class SubmissionValidatorTest : public ::testing::Test {
protected:
    SubmissionValidatorTest()
        : config_(make_test_config())
        , allocator_(mining::NonceAllocatorConfig{
              config_.jobs.slice_width, config_.jobs.min_slice_width, false})
        , store_(daemon_, allocator_, config_.monerod, config_.jobs)
        , registry_(config_.server, config_.jobs, config_.limits, store_, allocator_)
        , validator_(registry_, store_, verifier_, &events_)
    {
    }

    void SetUp() override {
        ASSERT_TRUE(store_.refresh());
        auto id = registry_.register_session("10.0.0.1");
        ASSERT_TRUE(id);
        session_ = *id;
        auto job = registry_.assign_job(session_);
        ASSERT_TRUE(job);
        job_ = *job;
    }

    /**
     * @brief Кандидат по текущему заданию
     */
    [[nodiscard]] mining::Candidate candidate(uint64_t difficulty, bool with_blob = false,
                                              uint32_t nonce = 0x11223344) const {
        mining::Candidate c;
        c.job_id = job_.job_id;
        c.nonce = nonce;
        c.result_hash = hash_with_difficulty(difficulty);
        if (with_blob) {
            c.blob = blob_with_nonce(job_.blob, nonce);
        }
        return c;
    }

    [[nodiscard]] mining::SubmissionResult validate(const mining::Candidate& c) {
        return validator_.validate(session_, c, job_.issued_at + 1ms);
    }

    Config config_;
    MockDaemon daemon_;
    CountingVerifier verifier_;
    monitoring::EventHub events_;
    mining::NonceAllocator allocator_;
    mining::TemplateStore store_;
    mining::SessionRegistry registry_;
    mining::SubmissionValidator validator_;

    mining::SessionId session_ = 0;
    mining::Job job_;
};

namespace {

/**
 * @brief Получить причину отклонения
 */
std::optional<mining::RejectReason> reason_of(const mining::SubmissionResult& result) {
    if (auto* rejected = std::get_if<mining::Rejected>(&result)) {
        return rejected->reason;
    }
    return std::nullopt;
}

} // anonymous namespace

// =============================================================================
// Share и блок
// =============================================================================

/**
 * @brief Тест: хеш уровня share принимается и не становится блоком
 */
TEST_F(SubmissionValidatorTest, ShareAccepted) {
    auto result = validate(candidate(TEST_SHARE_DIFFICULTY));

    auto* accepted = std::get_if<mining::Accepted>(&result);
    ASSERT_NE(accepted, nullptr);
    EXPECT_EQ(accepted->job_id, job_.job_id);
    EXPECT_GE(accepted->hash_difficulty, TEST_SHARE_DIFFICULTY);
    EXPECT_LT(accepted->hash_difficulty, TEST_NETWORK_DIFFICULTY);
    EXPECT_EQ(verifier_.calls.load(), 1);
}

/**
 * @brief Тест: share с корректным blob
 */
TEST_F(SubmissionValidatorTest, ShareWithBlobAccepted) {
    auto result = validate(candidate(TEST_SHARE_DIFFICULTY, true));
    EXPECT_TRUE(std::holds_alternative<mining::Accepted>(result));
}

/**
 * @brief Тест: хеш уровня сети становится AcceptedBlock
 */
TEST_F(SubmissionValidatorTest, NetworkLevelHashIsBlock) {
    auto c = candidate(TEST_NETWORK_DIFFICULTY * 2, true);
    auto result = validate(c);

    auto* block = std::get_if<mining::AcceptedBlock>(&result);
    ASSERT_NE(block, nullptr);
    EXPECT_EQ(block->candidate.session_id, session_);
    EXPECT_EQ(block->candidate.job_id, job_.job_id);
    EXPECT_EQ(block->candidate.generation, 1u);
    EXPECT_EQ(block->candidate.height, 100u);
    EXPECT_EQ(block->candidate.nonce, c.nonce);
    EXPECT_EQ(block->candidate.blob, c.blob);
    EXPECT_EQ(block->candidate.hash, c.result_hash);
    EXPECT_EQ(validator_.stats().blocks, 1u);
}

/**
 * @brief Тест: решение без blob собирается из blob задания и nonce
 */
TEST_F(SubmissionValidatorTest, BlockWithoutBlobUsesJobBlob) {
    auto result = validate(candidate(TEST_NETWORK_DIFFICULTY * 2, false, 0xCAFE));

    auto* block = std::get_if<mining::AcceptedBlock>(&result);
    ASSERT_NE(block, nullptr);
    EXPECT_EQ(block->candidate.nonce, 0xCAFEu);
    EXPECT_EQ(block->candidate.blob, blob_with_nonce(job_.blob, 0xCAFE));
    EXPECT_EQ(block->forward, mining::ForwardStatus::Pending);
}

/**
 * @brief Тест: хеш ниже share target
 */
TEST_F(SubmissionValidatorTest, WeakHashIsInvalidProof) {
    auto result = validate(candidate(TEST_SHARE_DIFFICULTY / 100));
    EXPECT_EQ(reason_of(result), mining::RejectReason::InvalidProof);
}

/**
 * @brief Тест: нулевой хеш отклоняется verifier
 */
TEST_F(SubmissionValidatorTest, ZeroHashIsInvalidProof) {
    auto c = candidate(TEST_SHARE_DIFFICULTY);
    c.result_hash = Hash256{};
    EXPECT_EQ(reason_of(validate(c)), mining::RejectReason::InvalidProof);
}

// =============================================================================
// Диапазон и blob
// =============================================================================

/**
 * @brief Тест: печать перенесена в чужой срез
 */
TEST_F(SubmissionValidatorTest, StampInForeignSliceIsOutOfRange) {
    auto c = candidate(TEST_NETWORK_DIFFICULTY * 2, true);
    for (uint32_t i = job_.nonce_range.start; i < job_.nonce_range.end; ++i) {
        c.blob[i] = 0;
    }
    c.blob[job_.nonce_range.end] = 0x01;

    EXPECT_EQ(reason_of(validate(c)), mining::RejectReason::OutOfRange);
    EXPECT_EQ(verifier_.calls.load(), 0);
}

/**
 * @brief Тест: нулевая зарезервированная область (blob шаблона без печати)
 */
TEST_F(SubmissionValidatorTest, UnstampedBlobIsOutOfRange) {
    auto c = candidate(TEST_SHARE_DIFFICULTY, true);
    c.blob = blob_with_nonce(job_.block_template->blob, c.nonce);

    EXPECT_EQ(reason_of(validate(c)), mining::RejectReason::OutOfRange);
    EXPECT_EQ(verifier_.calls.load(), 0);
}

/**
 * @brief Тест: печать изменена внутри собственного среза
 */
TEST_F(SubmissionValidatorTest, AlteredStampIsOutOfRange) {
    auto c = candidate(TEST_SHARE_DIFFICULTY, true);
    c.blob[job_.nonce_range.start + 1] ^= 0xFF;

    EXPECT_EQ(reason_of(validate(c)), mining::RejectReason::OutOfRange);
    EXPECT_EQ(verifier_.calls.load(), 0);
}

/**
 * @brief Тест: blob изменён вне зарезервированной области
 */
TEST_F(SubmissionValidatorTest, BlobModifiedOutsideRange) {
    auto c = candidate(TEST_SHARE_DIFFICULTY, true);
    c.blob[10] ^= 0xFF;

    EXPECT_EQ(reason_of(validate(c)), mining::RejectReason::OutOfRange);
    EXPECT_EQ(verifier_.calls.load(), 0);
}

/**
 * @brief Тест: blob другой длины
 */
TEST_F(SubmissionValidatorTest, BlobLengthMismatch) {
    auto c = candidate(TEST_SHARE_DIFFICULTY, true);
    c.blob.push_back(0);

    EXPECT_EQ(reason_of(validate(c)), mining::RejectReason::Malformed);
}

/**
 * @brief Тест: nonce сообщения не совпадает с nonce в blob
 */
TEST_F(SubmissionValidatorTest, NonceMismatchIsMalformed) {
    auto c = candidate(TEST_SHARE_DIFFICULTY, true);
    c.nonce += 1;

    EXPECT_EQ(reason_of(validate(c)), mining::RejectReason::Malformed);
}

/**
 * @brief Тест: одинаковый blob от двух сессий с разными срезами
 *
 * Сессии получают разные blob, и blob одной сессии не принимается по
 * заданию другой.
 */
TEST_F(SubmissionValidatorTest, SameBlobRejectedForOtherSession) {
    auto other = registry_.register_session("10.0.0.2");
    ASSERT_TRUE(other);
    auto other_job = registry_.assign_job(*other);
    ASSERT_TRUE(other_job);
    ASSERT_FALSE(other_job->nonce_range.overlaps(job_.nonce_range));

    EXPECT_NE(blob_with_nonce(job_.blob, 7), blob_with_nonce(other_job->blob, 7));

    auto own = candidate(TEST_SHARE_DIFFICULTY, true, 7);
    EXPECT_TRUE(std::holds_alternative<mining::Accepted>(validate(own)));

    mining::Candidate foreign = own;
    foreign.job_id = other_job->job_id;
    auto result = validator_.validate(*other, foreign, other_job->issued_at + 1ms);
    EXPECT_EQ(reason_of(result), mining::RejectReason::OutOfRange);
}

/**
 * @brief Тест: сравнение с blob задания допускает только nonce заголовка
 */
TEST(JobBlobTest, MatchesOnlyHeaderNonceChanges) {
    Bytes job_blob = make_blob(7);

    Bytes ok = job_blob;
    ok[mining::HEADER_NONCE_OFFSET] = 0xEE;
    ok[mining::HEADER_NONCE_OFFSET + 3] = 0xEE;
    EXPECT_TRUE(mining::matches_job_blob(job_blob, ok));

    Bytes stamp = job_blob;
    stamp[TEST_RESERVED_OFFSET] ^= 0x01;
    EXPECT_FALSE(mining::matches_job_blob(job_blob, stamp));

    Bytes shorter(job_blob.begin(), job_blob.end() - 1);
    EXPECT_FALSE(mining::matches_job_blob(job_blob, shorter));
}

/**
 * @brief Тест: печать задания и координата среза
 */
TEST(JobBlobTest, StampIdentifiesSlice) {
    mining::Template tmpl;
    tmpl.blob = make_blob(3);
    tmpl.blob[TEST_RESERVED_OFFSET + 5] = 0x99;
    tmpl.reserved_offset = TEST_RESERVED_OFFSET;
    tmpl.reserved_size = 8;

    mining::NonceRange range{TEST_RESERVED_OFFSET + 2, TEST_RESERVED_OFFSET + 4};
    for (mining::JobId id : {0ull, 254ull, 255ull, 256ull}) {
        auto value = mining::make_reserved_value(range, id);
        ASSERT_EQ(value.size(), 2u);
        EXPECT_NE(value[0], 0);

        auto blob = mining::stamp_job_blob(tmpl, range, value);
        EXPECT_EQ(blob[TEST_RESERVED_OFFSET + 5], 0);
        EXPECT_EQ(blob[range.start], value[0]);
        EXPECT_EQ(mining::reserved_coordinate(tmpl, blob), range.start);
    }

    EXPECT_EQ(mining::reserved_coordinate(tmpl, make_blob(3)), std::nullopt);

    Bytes blob = make_blob(3);
    mining::write_header_nonce(blob, 0xA1B2C3D4);
    EXPECT_EQ(blob[mining::HEADER_NONCE_OFFSET], 0xD4);
    EXPECT_EQ(mining::read_header_nonce(blob), 0xA1B2C3D4u);
}

// =============================================================================
// Принадлежность и устаревание
// =============================================================================

/**
 * @brief Тест: неизвестное задание
 */
TEST_F(SubmissionValidatorTest, UnknownJob) {
    auto c = candidate(TEST_SHARE_DIFFICULTY);
    c.job_id = job_.job_id + 100;
    EXPECT_EQ(reason_of(validate(c)), mining::RejectReason::UnknownJob);
}

/**
 * @brief Тест: задание другой сессии
 */
TEST_F(SubmissionValidatorTest, ForeignJobIsUnknown) {
    auto other = registry_.register_session("10.0.0.2");
    ASSERT_TRUE(other);
    auto other_job = registry_.assign_job(*other);
    ASSERT_TRUE(other_job);

    auto c = candidate(TEST_SHARE_DIFFICULTY);
    c.job_id = other_job->job_id;

    EXPECT_EQ(reason_of(validate(c)), mining::RejectReason::UnknownJob);
}

/**
 * @brief Тест: истёкший ttl
 */
TEST_F(SubmissionValidatorTest, ExpiredJobIsStale) {
    auto result = validator_.validate(session_, candidate(TEST_SHARE_DIFFICULTY),
                                      job_.issued_at + job_.ttl + 1ms);
    EXPECT_EQ(reason_of(result), mining::RejectReason::Stale);
    EXPECT_EQ(validator_.stats().stale, 1u);
}

/**
 * @brief Тест: вытесненное поколение в grace окне
 */
TEST_F(SubmissionValidatorTest, SupersededGenerationWithinGrace) {
    daemon_.set_height(101);
    ASSERT_TRUE(store_.refresh());

    // Share по вытесненному поколению ещё принимается
    auto share = validate(candidate(TEST_SHARE_DIFFICULTY));
    EXPECT_TRUE(std::holds_alternative<mining::Accepted>(share));

    // Решение блока по вытесненному поколению не пересылается
    auto block = validate(candidate(TEST_NETWORK_DIFFICULTY * 2, true));
    auto* stale = std::get_if<mining::Stale>(&block);
    ASSERT_NE(stale, nullptr);
    EXPECT_EQ(stale->job_id, job_.job_id);
}

/**
 * @brief Тест: вытесненное поколение вне grace окна
 */
TEST_F(SubmissionValidatorTest, SupersededGenerationBeyondGrace) {
    daemon_.set_height(101);
    ASSERT_TRUE(store_.refresh());

    auto at = store_.superseded_at(1);
    ASSERT_TRUE(at);
    auto beyond = *at + std::chrono::milliseconds(config_.jobs.stale_job_grace_ms) + 1ms;

    auto result = validator_.validate(session_, candidate(TEST_SHARE_DIFFICULTY), beyond);
    EXPECT_EQ(reason_of(result), mining::RejectReason::Stale);
}

/**
 * @brief Тест: счётчики и события
 */
TEST_F(SubmissionValidatorTest, StatsAndEvents) {
    int rejections = 0;
    int shares = 0;
    events_.subscribe([&](const monitoring::Event& event) {
        if (event.type == monitoring::EventType::SubmissionRejected) ++rejections;
        if (event.type == monitoring::EventType::ShareAccepted) ++shares;
    });

    (void)validate(candidate(TEST_SHARE_DIFFICULTY));
    (void)validate(candidate(TEST_SHARE_DIFFICULTY / 100));

    auto stats = validator_.stats();
    EXPECT_EQ(stats.submitted, 2u);
    EXPECT_EQ(stats.accepted, 1u);
    EXPECT_EQ(stats.rejected, 1u);
    EXPECT_EQ(stats.verifier_calls, 2u);
    EXPECT_EQ(shares, 1);
    EXPECT_EQ(rejections, 1);

    validator_.reset_stats();
    EXPECT_EQ(validator_.stats().submitted, 0u);
}

} // namespace xmrweb::tests
