#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "data/dataset.hpp"
#include "toy_fixtures.hpp"

#include <limits>

using namespace eap;

TEST(DatasetTest, CountsBatchesAndExamples) {
    Dataset d = eap_test::randomDataset(1, 3, 4, eap_test::smallDims());
    EXPECT_EQ(d.batchCount(), 3u);
    EXPECT_EQ(d.exampleCount(), 12u);
    EXPECT_NO_THROW(d.validate(eap_test::smallDims().d_input));
}

TEST(DatasetTest, SliceAndConcat) {
    Dataset d = eap_test::randomDataset(2, 4, 2, eap_test::smallDims());
    Dataset head = d.slice(0, 1);
    Dataset tail = d.slice(1, 10);
    EXPECT_EQ(head.batchCount(), 1u);
    EXPECT_EQ(tail.batchCount(), 3u);

    Dataset joined = Dataset::concat(head, tail);
    ASSERT_EQ(joined.batchCount(), 4u);
    for (size_t i = 0; i < 4; i++) {
        EXPECT_EQ(joined.batch(i).clean, d.batch(i).clean);
    }
    EXPECT_TRUE(d.slice(9, 1).empty());
}

TEST(DatasetTest, SliceWithHugeCountRunsToEnd) {
    Dataset d = eap_test::randomDataset(7, 4, 2, eap_test::smallDims());
    Dataset rest = d.slice(1, std::numeric_limits<size_t>::max());
    ASSERT_EQ(rest.batchCount(), 3u);
    EXPECT_EQ(rest.batch(0).clean, d.batch(1).clean);
    EXPECT_TRUE(d.slice(4, std::numeric_limits<size_t>::max()).empty());
}

TEST(DatasetTest, MismatchedCorruptedRowsRejected) {
    Dataset d = eap_test::randomDataset(3, 2, 3, eap_test::smallDims());
    Batch bad = d.batch(1);
    bad.corrupted = ModelInput::Zero(2, eap_test::smallDims().d_input);
    Dataset broken = Dataset::concat(d.slice(0, 1), Dataset(std::vector<Batch>{bad}));
    EXPECT_THROW(broken.validate(), ConfigurationError);
}

TEST(DatasetTest, MismatchedLabelsRejected) {
    Dataset d = eap_test::randomDataset(4, 1, 3, eap_test::smallDims());
    Batch bad = d.batch(0);
    bad.labels.pop_back();
    EXPECT_THROW(Dataset(std::vector<Batch>{bad}).validate(), ConfigurationError);
}

TEST(DatasetTest, MismatchedLengthsRejected) {
    Dataset d = eap_test::randomDataset(5, 1, 3, eap_test::smallDims());
    Batch bad = d.batch(0);
    bad.input_lengths.push_back(1);
    EXPECT_THROW(Dataset(std::vector<Batch>{bad}).validate(), ConfigurationError);
}

TEST(DatasetTest, WidthMismatchRejected) {
    Dataset d = eap_test::randomDataset(6, 1, 3, eap_test::smallDims());
    EXPECT_THROW(d.validate(eap_test::smallDims().d_input + 1), ConfigurationError);

    Batch bad = d.batch(0);
    bad.corrupted = ModelInput::Zero(3, 2);
    EXPECT_THROW(Dataset(std::vector<Batch>{bad}).validate(), ConfigurationError);
}

TEST(DatasetTest, EmptyBatchRejected) {
    EXPECT_THROW(Dataset(std::vector<Batch>(1)).validate(), ConfigurationError);
}
