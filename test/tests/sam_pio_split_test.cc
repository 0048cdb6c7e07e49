#include "utils/sam_pio_test_helper.hxx"

using ::testing::HasSubstr;
using namespace sampio;

DECLARE_FAKE_PIO_PORT(SplitPortA, 'A');
DECLARE_FAKE_PIO_PORT(SplitPortB, 'B');
DECLARE_FAKE_PIO_PORT(SplitPortC, 'C');
DECLARE_FAKE_PIO_PORT(TakePort, 'A');
DECLARE_FAKE_PIO_PORT(MovePort, 'B');
DECLARE_FAKE_PIO_PORT(PartsPort, 'C');
DECLARE_FAKE_PIO_PORT(LogPort, 'B');
DECLARE_FAKE_PIO_PORT(GatePort, 'A');

/// Splits PORT and checks that every pin comes out as a floating input and
/// that no register was touched.
template <class PORT> void check_split()
{
    PORT::reset();
    PioRegisterDump before = dump_registers<PORT>();
    auto parts = PioPeripheral<PORT>::take().split();
    EXPECT_EQ(before, dump_registers<PORT>());

    unsigned count = 0;
    for_each_reset_pin(&parts, [&count](auto &pin) {
        typedef typename std::decay<decltype(pin)>::type Pin;
        static_assert(
            std::is_same<typename Pin::Mode, Input<Floating>>::value, "");
        static_assert(std::is_same<typename Pin::Port, PORT>::value, "");
        EXPECT_TRUE(pin.is_owned());
        EXPECT_EQ(count, pin.pin_num());
        EXPECT_EQ(1u << count, pin.pin_mask());
        ++count;
    });
    EXPECT_EQ(32u, count);

    EXPECT_TRUE(parts.per.is_owned());
    EXPECT_TRUE(parts.pdr.is_owned());
    EXPECT_TRUE(parts.abcdsr1.is_owned());
    EXPECT_TRUE(parts.abcdsr2.is_owned());
    EXPECT_TRUE(parts.oer.is_owned());
    EXPECT_TRUE(parts.odr.is_owned());
}

TEST(SamPioSplitTest, PortA)
{
    check_split<SplitPortA>();
}

TEST(SamPioSplitTest, PortB)
{
    check_split<SplitPortB>();
}

TEST(SamPioSplitTest, PortC)
{
    check_split<SplitPortC>();
}

// The real ports are not backed by memory on the host. Splitting must not
// access any register, otherwise these would crash.
TEST(SamPioSplitTest, HardwarePortsSplitWithoutRegisterAccess)
{
    auto a = PioPeripheral<PioA>::take().split();
    auto b = PioPeripheral<PioB>::take().split();
    auto c = PioPeripheral<PioC>::take().split();
    EXPECT_TRUE(a.pin<0>().is_owned());
    EXPECT_TRUE(b.pin<17>().is_owned());
    EXPECT_TRUE(c.pin<31>().is_owned());
    EXPECT_TRUE(c.abcdsr2.is_owned());
}

TEST(SamPioSplitTest, TakeTwiceDies)
{
    TakePort::reset();
    auto port = PioPeripheral<TakePort>::take();
    EXPECT_DEATH(PioPeripheral<TakePort>::take(), "taken_");
}

TEST(SamPioSplitTest, SplitTwiceDies)
{
    MovePort::reset();
    auto port = PioPeripheral<MovePort>::take();
    auto other = std::move(port);
    EXPECT_DEATH(std::move(port).split(), "owned_");

    auto parts = std::move(other).split();
    EXPECT_DEATH(std::move(other).split(), "owned_");
}

TEST(SamPioSplitTest, MoveParts)
{
    auto parts = split_fake_port<PartsPort>();
    auto moved = std::move(parts);
    EXPECT_FALSE(parts.pdr.is_owned());
    EXPECT_FALSE(parts.pin<3>().is_owned());
    EXPECT_TRUE(moved.pdr.is_owned());
    EXPECT_TRUE(moved.pin<3>().is_owned());

    auto pin = std::move(moved.pin<3>());
    EXPECT_FALSE(moved.pin<3>().is_owned());
    EXPECT_TRUE(pin.is_owned());
    auto token = std::move(moved.oer);
    EXPECT_FALSE(moved.oer.is_owned());
    EXPECT_TRUE(token.is_owned());
}

TEST(SamPioSplitTest, SplitIsLogged)
{
    LogCapture capture;
    auto parts = split_fake_port<LogPort>();
    EXPECT_THAT(capture.output(), HasSubstr("PIOB split"));
}

// Holding the tokens does not give access to the other pins. Only the bits of
// the pins that were converted change.
TEST(SamPioSplitTest, TokensOnlyReconfigureConvertedPins)
{
    auto parts = split_fake_port<GatePort>();
    PioRegisterDump expected = dump_registers<GatePort>();

    auto tx = std::move(parts.pin<9>())
                  .into_peripheral<PeripheralB>(
                      parts.pdr, parts.abcdsr1, parts.abcdsr2);
    auto led = std::move(parts.pin<4>()).into_output(parts.oer);

    expected[PIO_DUMP_INDEX(PIO_PDR)] = 1u << 9;
    expected[PIO_DUMP_INDEX(PIO_ABCDSR)] = 1u << 9;
    expected[PIO_DUMP_INDEX(PIO_OER)] = 1u << 4;
    EXPECT_EQ(expected, dump_registers<GatePort>());

    EXPECT_TRUE(parts.pin<5>().is_owned());
    EXPECT_TRUE(parts.pdr.is_owned());
    EXPECT_TRUE(parts.abcdsr1.is_owned());
}
