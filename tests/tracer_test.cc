/* Copyright 2026 The contracer Authors, all rights reserved. */

#include <gtest/gtest.h>

#include "contracer/model/tracer.h"

using namespace contracer::model;

TEST(TracerTest, ParsesClauseNames) {
  ObservationClause clause;
  ASSERT_TRUE(ParseObservationClause("ct-nonspecstore", &clause));
  EXPECT_EQ(ObservationClause::kCTNonSpecStore, clause);
  ASSERT_TRUE(ParseObservationClause("l1d", &clause));
  EXPECT_EQ(ObservationClause::kL1D, clause);
  EXPECT_STREQ("l1d", ObservationClauseName(clause));
  EXPECT_FALSE(ParseObservationClause("bogus", &clause));
}

TEST(TracerTest, CacheSets) {
  Tracer tracer(ObservationClause::kL1D);
  tracer.ObserveInstruction(0x8000);
  tracer.ObserveMemAccess(false, 0x1000040, false);
  tracer.ObserveMemAccess(true, 0x1001000 + 63 * 64, true);
  ASSERT_EQ(2U, tracer.Observations().size());
  EXPECT_EQ(1U, tracer.Observations()[0]);
  EXPECT_EQ(63U, tracer.Observations()[1]);
}

TEST(TracerTest, PCOnly) {
  Tracer tracer(ObservationClause::kPC);
  EXPECT_TRUE(tracer.ObservesPC());
  EXPECT_FALSE(tracer.ObservesAddresses());
  tracer.ObserveInstruction(0x8000);
  tracer.ObserveMemAccess(false, 0x1000000, false);
  ASSERT_EQ(1U, tracer.Observations().size());
  EXPECT_EQ(0x8000U, tracer.Observations()[0]);
}

TEST(TracerTest, SpeculativeStoresAreHidden) {
  Tracer tracer(ObservationClause::kCTNonSpecStore);
  tracer.ObserveMemAccess(true, 0x10, true);
  tracer.ObserveMemAccess(true, 0x20, false);
  tracer.ObserveMemAccess(false, 0x30, true);
  ASSERT_EQ(2U, tracer.Observations().size());
  EXPECT_EQ(0x20U, tracer.Observations()[0]);
  EXPECT_EQ(0x30U, tracer.Observations()[1]);
}

TEST(TracerTest, ContractTraceHashesObservations) {
  Tracer a(ObservationClause::kCT);
  Tracer b(ObservationClause::kCT);
  a.ObserveInstruction(0x8000);
  a.ObserveMemAccess(false, 0x1000000, false);
  b.ObserveInstruction(0x8000);
  b.ObserveMemAccess(false, 0x1000000, false);
  EXPECT_EQ(a.ContractTrace(), b.ContractTrace());

  b.ObserveMemAccess(false, 0x1000008, true);
  EXPECT_NE(a.ContractTrace(), b.ContractTrace());

  b.Reset();
  EXPECT_TRUE(b.Observations().empty());
}
