#include "receiver.hpp"

using namespace ble;

bool ble::select_manufacturer_data(BlePacket& p, manufacturer_data_map const& data,
                                   uint16_t preferred) {
    if (data.empty()) return false;
    auto it = data.find(preferred);
    if (it == data.end()) it = data.begin();
    p.manufacturer_id   = it->first;
    p.manufacturer_data = it->second;
    return true;
}
