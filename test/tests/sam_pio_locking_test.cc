#include <thread>

#include "utils/sam_pio_test_helper.hxx"

using namespace sampio;

DECLARE_FAKE_PIO_PORT(ThreadPortA, 'A');
DECLARE_FAKE_PIO_PORT(ThreadPortB, 'B');
DECLARE_FAKE_PIO_PORT(ThreadPortC, 'C');
DECLARE_FAKE_PIO_PORT(ThreadPortD, 'A');

TEST(SamPioLockingTest, EnabledByDefault)
{
    EXPECT_NE(0, config_sam_pio_select_locking());
}

/// Hands the even pins of PORT to peripheral D from one thread and the odd
/// pins to peripheral B from another. Both threads do read-modify-writes on
/// the same select registers; without the lock some updates would get lost.
template <class PORT> void select_concurrently()
{
    auto parts = split_fake_port<PORT>();
    auto configure = [&parts](bool odd) {
        for_each_reset_pin(&parts, [&parts, odd](auto &pin) {
            bool pin_is_odd = (pin.pin_num() & 1) != 0;
            if (pin_is_odd != odd)
            {
                return;
            }
            if (odd)
            {
                auto p = std::move(pin).template into_peripheral<PeripheralB>(
                    parts.pdr, parts.abcdsr1, parts.abcdsr2);
            }
            else
            {
                auto p = std::move(pin).template into_peripheral<PeripheralD>(
                    parts.pdr, parts.abcdsr1, parts.abcdsr2);
            }
        });
    };
    std::thread t(configure, true);
    configure(false);
    t.join();

    EXPECT_EQ(0x55555555u, PIO_REG(PORT, PIO_ABCDSR[0]));
    EXPECT_EQ(0xFFFFFFFFu, PIO_REG(PORT, PIO_ABCDSR[1]));
    EXPECT_FALSE(parts.template pin<0>().is_owned());
    EXPECT_FALSE(parts.template pin<31>().is_owned());
}

TEST(SamPioLockingTest, ConcurrentSelect)
{
    select_concurrently<ThreadPortA>();
    select_concurrently<ThreadPortB>();
    select_concurrently<ThreadPortC>();
    select_concurrently<ThreadPortD>();
}
