#include "arch/intrin.hpp"

arch::IHostedIntrin *arch::HostedIntrin::gImpl = arch::IHostedIntrin::GetDefault();
