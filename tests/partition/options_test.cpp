#include <gtest/gtest.h>
#include "partition/options.hpp"

#include <set>
#include <string>

namespace mpart
{
    namespace testing
    {

        // =============================================================================
        // Options Vector Tests
        // =============================================================================

        TEST(OptionsTest, DefaultsAreMinusOne)
        {
            Options options;
            for (Idx v : options.values())
            {
                EXPECT_EQ(v, OPTION_DEFAULT);
            }
            EXPECT_EQ(options.values().size(), static_cast<std::size_t>(METIS_NOPTIONS));
        }

        TEST(OptionsTest, SetWritesOnlyItsSlot)
        {
            Options options;
            options.set(Option::numIterations(7));

            EXPECT_EQ(options.values()[METIS_OPTION_NITER], 7);
            EXPECT_TRUE(options.isSet(OptionKey::NumIterations));
            for (std::size_t i = 0; i < options.values().size(); ++i)
            {
                if (i != static_cast<std::size_t>(METIS_OPTION_NITER))
                {
                    EXPECT_EQ(options.values()[i], OPTION_DEFAULT) << "slot " << i;
                }
            }
        }

        TEST(OptionsTest, LaterSetOverridesEarlier)
        {
            Options options;
            options.set(Option::seed(1)).set(Option::seed(9));
            EXPECT_EQ(options.get(OptionKey::Seed), 9);
        }

        TEST(OptionsTest, ResetRestoresDefaults)
        {
            Options options;
            options.set(Option::imbalanceFactor(50));
            options.reset();
            EXPECT_EQ(options, Options());
        }

        TEST(OptionsTest, SetAllReplacesEverySlot)
        {
            OptionArray raw;
            raw.fill(3);
            Options options;
            options.setAll(raw);
            EXPECT_EQ(options.values(), raw);
        }

        // =============================================================================
        // Option Encoding Tests
        // =============================================================================

        TEST(OptionTest, SlotsMatchMetis)
        {
            EXPECT_EQ(optionSlot(OptionKey::PartitionMethod), static_cast<std::size_t>(METIS_OPTION_PTYPE));
            EXPECT_EQ(optionSlot(OptionKey::Objective), static_cast<std::size_t>(METIS_OPTION_OBJTYPE));
            EXPECT_EQ(optionSlot(OptionKey::Coarsening), static_cast<std::size_t>(METIS_OPTION_CTYPE));
            EXPECT_EQ(optionSlot(OptionKey::InitialPartitioning), static_cast<std::size_t>(METIS_OPTION_IPTYPE));
            EXPECT_EQ(optionSlot(OptionKey::Refinement), static_cast<std::size_t>(METIS_OPTION_RTYPE));
            EXPECT_EQ(optionSlot(OptionKey::NumCuts), static_cast<std::size_t>(METIS_OPTION_NCUTS));
            EXPECT_EQ(optionSlot(OptionKey::NumSeparators), static_cast<std::size_t>(METIS_OPTION_NSEPS));
            EXPECT_EQ(optionSlot(OptionKey::Numbering), static_cast<std::size_t>(METIS_OPTION_NUMBERING));
            EXPECT_EQ(optionSlot(OptionKey::NumIterations), static_cast<std::size_t>(METIS_OPTION_NITER));
            EXPECT_EQ(optionSlot(OptionKey::Seed), static_cast<std::size_t>(METIS_OPTION_SEED));
            EXPECT_EQ(optionSlot(OptionKey::MinConnectivity), static_cast<std::size_t>(METIS_OPTION_MINCONN));
            EXPECT_EQ(optionSlot(OptionKey::NoTwoHop), static_cast<std::size_t>(METIS_OPTION_NO2HOP));
            EXPECT_EQ(optionSlot(OptionKey::Contiguous), static_cast<std::size_t>(METIS_OPTION_CONTIG));
            EXPECT_EQ(optionSlot(OptionKey::Compress), static_cast<std::size_t>(METIS_OPTION_COMPRESS));
            EXPECT_EQ(optionSlot(OptionKey::ComponentOrder), static_cast<std::size_t>(METIS_OPTION_CCORDER));
            EXPECT_EQ(optionSlot(OptionKey::PruningFactor), static_cast<std::size_t>(METIS_OPTION_PFACTOR));
            EXPECT_EQ(optionSlot(OptionKey::ImbalanceFactor), static_cast<std::size_t>(METIS_OPTION_UFACTOR));
            EXPECT_EQ(optionSlot(OptionKey::DebugLevel), static_cast<std::size_t>(METIS_OPTION_DBGLVL));
        }

        TEST(OptionTest, SlotsAreDistinct)
        {
            std::set<std::size_t> slots;
            for (std::size_t k = 0; k < OPTION_KEY_COUNT; ++k)
            {
                slots.insert(optionSlot(static_cast<OptionKey>(k)));
            }
            EXPECT_EQ(slots.size(), static_cast<std::size_t>(OPTION_KEY_COUNT));
        }

        TEST(OptionTest, EnumeratedValuesUseMetisConstants)
        {
            EXPECT_EQ(Option::partitionMethod(PartitionMethod::RecursiveBisection).value(), METIS_PTYPE_RB);
            EXPECT_EQ(Option::partitionMethod(PartitionMethod::Kway).value(), METIS_PTYPE_KWAY);
            EXPECT_EQ(Option::objective(Objective::Volume).value(), METIS_OBJTYPE_VOL);
            EXPECT_EQ(Option::coarsening(Coarsening::SortedHeavyEdge).value(), METIS_CTYPE_SHEM);
            EXPECT_EQ(Option::initialPartitioning(InitialPartitioning::Node).value(), METIS_IPTYPE_NODE);
            EXPECT_EQ(Option::refinement(Refinement::Sep1Sided).value(), METIS_RTYPE_SEP1SIDED);
            EXPECT_EQ(Option::numbering(Numbering::C).value(), 0);
            EXPECT_EQ(Option::numbering(Numbering::Fortran).value(), 1);
        }

        TEST(OptionTest, BooleanOptionsEncodeAsZeroOrOne)
        {
            EXPECT_EQ(Option::contiguous(true).value(), 1);
            EXPECT_EQ(Option::contiguous(false).value(), 0);
            EXPECT_EQ(Option::minConnectivity(true).key(), OptionKey::MinConnectivity);
        }

        // =============================================================================
        // Debug Level Tests
        // =============================================================================

        TEST(DebugLevelTest, EachFlagIsOneBit)
        {
            DebugLevel level;
            EXPECT_EQ(level.encode(), 0);

            level.info = true;
            EXPECT_EQ(level.encode(), 1);

            DebugLevel all;
            all.info = all.time = all.coarsen = all.refine = all.ipart = true;
            all.moveInfo = all.sepInfo = all.connInfo = all.contigInfo = true;
            EXPECT_EQ(all.encode(), 1 + 2 + 4 + 8 + 16 + 32 + 64 + 128 + 256);
        }

        TEST(DebugLevelTest, FlagValues)
        {
            DebugLevel contig;
            contig.contigInfo = true;
            EXPECT_EQ(contig.encode(), 256);

            DebugLevel conn;
            conn.connInfo = true;
            EXPECT_EQ(conn.encode(), 128);
        }

        TEST(DebugLevelTest, DecodeInvertsEncode)
        {
            DebugLevel level;
            level.time = true;
            level.sepInfo = true;
            EXPECT_EQ(DebugLevel::decode(level.encode()).encode(), level.encode());
        }

        // =============================================================================
        // Name Lookup Tests
        // =============================================================================

        TEST(OptionNameTest, NamesRoundTrip)
        {
            for (std::size_t k = 0; k < OPTION_KEY_COUNT; ++k)
            {
                OptionKey key = static_cast<OptionKey>(k);
                EXPECT_EQ(optionKeyFromName(optionName(key)), key);
            }
        }

        TEST(OptionNameTest, KnownNames)
        {
            EXPECT_STREQ(optionName(OptionKey::ImbalanceFactor), "ufactor");
            EXPECT_STREQ(optionName(OptionKey::NumIterations), "niter");
            EXPECT_EQ(optionKeyFromName("dbglvl"), OptionKey::DebugLevel);
        }

        TEST(OptionNameTest, UnknownNameThrows)
        {
            EXPECT_THROW(optionKeyFromName("bogus"), std::invalid_argument);
        }

    } // namespace testing
} // namespace mpart
