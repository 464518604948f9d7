/*
 *	Client interface for Eufy Security device access
 *
 *	Cameras and sensors as reported by the device inventory. Behaviour that
 *	differs per model is selected by the device type tag of the record.
 *
 *	Functions taking an optional session will reuse that session when it is
 *	connected to the device's station, and otherwise open (and afterwards
 *	close) a session through the owning station.
 *
 *
 *	Copyright 2026 - eufypp contributors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+
 */

#ifndef _eufyDevice
#define _eufyDevice

#include "eufyParams.hpp"
#include "eufyScopedSession.hpp"
#include <json/json.h>
#include <string>
#include <map>
#include <memory>


namespace Eufy {
  namespace Device {
    // com.oceanwing.battery.cam.binder.model.QueryDeviceData
    enum type {
      STATION = 0,
      CAMERA = 1,
      SENSOR = 2,
      FLOODLIGHT = 3,
      CAMERA_E = 4,
      DOORBELL = 5,
      BATTERY_DOORBELL = 7,
      CAMERA2C = 8,
      CAMERA2 = 9,
      MOTION_SENSOR = 10,
      KEYPAD = 11,
      INDOOR_CAMERA = 30,
      INDOOR_PT_CAMERA = 31,
      LOCK_BASIC = 50,
      LOCK_ADVANCED = 51,
      LOCK_SIMPLE = 52
    }; // enum type

    bool isKnownType(const int code);
    bool isCamera(const type device_type);
    bool isDoorbell(const type device_type);
    bool isStation(const type device_type);
    bool isSensor(const type device_type);
  }; // namespace Device

  namespace GuardMode {
    enum value {
      AWAY = 0,
      HOME = 1,
      SCHEDULE = 2,
      DISARMED = 63
    }; // enum value
  }; // namespace GuardMode
}; // namespace Eufy


class eufyAPI;

class eufyDevice
{

public:
	eufyDevice(eufyAPI &api, const Json::Value &device_info);
	virtual ~eufyDevice() {}

	// returns nullptr for records that are neither camera nor sensor
	static std::unique_ptr<eufyDevice> create(eufyAPI &api, const Json::Value &device_info);

	Eufy::Device::type getType() const { return m_type; }
	bool isCamera() const { return Eufy::Device::isCamera(m_type); }
	bool isSensor() const { return Eufy::Device::isSensor(m_type); }

	int getStatus() const;
	std::string getHardwareVersion() const;
	std::string getSoftwareVersion() const;
	std::string getMac() const;
	std::string getModel() const;
	std::string getName() const;
	std::string getSerial() const;
	std::string getStationSerial() const;
	std::string getLastCameraImageUrl() const;
	eufyParams getParams() const;
	const Json::Value &getInfo() const { return m_device_info; }

	void update(const Json::Value &device_info);
	void refresh();

	void updateParam(const Eufy::Param::value param, const Json::Value &value);
	void updateParam(const std::string &name, const Json::Value &value);
	void updateParams(const std::map<Eufy::Param::value, Json::Value> &params);

	// cameras
	bool isMotionDetectionEnabled() const;
	void startDetection();
	void stopDetection();
	std::string startStream();
	void stopStream();

	// doorbell and floodlight cameras
	void enableOsd(const bool enable, eufySession *session = nullptr);
	// floodlight cameras
	void enableManualLight(const bool enable, eufySession *session = nullptr);

	eufyScopedSession acquireSession(eufySession *session = nullptr);

private:
	void requireCamera(const char *operation) const;

	eufyAPI &m_api;
	Json::Value m_device_info;
	Eufy::Device::type m_type;
};

#endif // _eufyDevice
