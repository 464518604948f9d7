/*
 *	Client interface for Eufy Security device access
 *
 *	Camera and sensor module
 *
 *
 *	Copyright 2026 - eufypp contributors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+
 */

#include "eufyDevice.hpp"
#include "eufyStation.hpp"
#include "eufyAPI.hpp"
#include "eufyErrors.hpp"


namespace Eufy {
  namespace Device {

bool isKnownType(const int code)
{
	switch (code)
	{
		case STATION:
		case CAMERA:
		case SENSOR:
		case FLOODLIGHT:
		case CAMERA_E:
		case DOORBELL:
		case BATTERY_DOORBELL:
		case CAMERA2C:
		case CAMERA2:
		case MOTION_SENSOR:
		case KEYPAD:
		case INDOOR_CAMERA:
		case INDOOR_PT_CAMERA:
		case LOCK_BASIC:
		case LOCK_ADVANCED:
		case LOCK_SIMPLE:
			return true;
		default:
			break;
	}
	return false;
}


bool isCamera(const type device_type)
{
	switch (device_type)
	{
		case BATTERY_DOORBELL:
		case DOORBELL:
		case CAMERA:
		case CAMERA2:
		case CAMERA2C:
		case CAMERA_E:
		case FLOODLIGHT:
		case INDOOR_CAMERA:
		case INDOOR_PT_CAMERA:
			return true;
		default:
			break;
	}
	return false;
}


bool isDoorbell(const type device_type)
{
	return (device_type == BATTERY_DOORBELL) || (device_type == DOORBELL);
}


// doorbells and floodlights connect directly, without a home base
bool isStation(const type device_type)
{
	return (device_type == STATION) || (device_type == DOORBELL) || (device_type == FLOODLIGHT);
}


bool isSensor(const type device_type)
{
	return (device_type == SENSOR) || (device_type == MOTION_SENSOR);
}

  }; // namespace Device
}; // namespace Eufy


eufyDevice::eufyDevice(eufyAPI &api, const Json::Value &device_info)
	: m_api(api)
	, m_type(Eufy::Device::STATION)
{
	update(device_info);
}


std::unique_ptr<eufyDevice> eufyDevice::create(eufyAPI &api, const Json::Value &device_info)
{
	int code = device_info["device_type"].asInt();
	if (!Eufy::Device::isKnownType(code))
		return nullptr;

	Eufy::Device::type device_type = (Eufy::Device::type)code;
	if (!Eufy::Device::isCamera(device_type) && !Eufy::Device::isSensor(device_type))
		return nullptr;

	return std::unique_ptr<eufyDevice>(new eufyDevice(api, device_info));
}


int eufyDevice::getStatus() const
{
	return m_device_info["status"].asInt();
}


std::string eufyDevice::getHardwareVersion() const
{
	return m_device_info["main_hw_version"].asString();
}


std::string eufyDevice::getSoftwareVersion() const
{
	return m_device_info["main_sw_version"].asString();
}


std::string eufyDevice::getMac() const
{
	return m_device_info["wifi_mac"].asString();
}


std::string eufyDevice::getModel() const
{
	return m_device_info["device_model"].asString();
}


std::string eufyDevice::getName() const
{
	return m_device_info["device_name"].asString();
}


std::string eufyDevice::getSerial() const
{
	return m_device_info["device_sn"].asString();
}


std::string eufyDevice::getStationSerial() const
{
	return m_device_info["station_sn"].asString();
}


std::string eufyDevice::getLastCameraImageUrl() const
{
	return m_device_info["cover_path"].asString();
}


eufyParams eufyDevice::getParams() const
{
	return eufyParams(m_device_info["params"]);
}


void eufyDevice::update(const Json::Value &device_info)
{
	int code = device_info["device_type"].asInt();
	if (!Eufy::Device::isKnownType(code))
		throw Eufy::Error("unknown device type " + std::to_string(code));

	m_device_info = device_info;
	m_type = (Eufy::Device::type)code;
}


void eufyDevice::refresh()
{
	m_api.updateDeviceInfo();
}


void eufyDevice::updateParam(const Eufy::Param::value param, const Json::Value &value)
{
	std::map<Eufy::Param::value, Json::Value> params;
	params[param] = value;
	updateParams(params);
}


void eufyDevice::updateParam(const std::string &name, const Json::Value &value)
{
	Eufy::Param::value param;
	if (!eufyParams::lookup(name, param))
		throw Eufy::ParamError("unknown parameter " + name);
	updateParam(param, value);
}


void eufyDevice::updateParams(const std::map<Eufy::Param::value, Json::Value> &params)
{
	Json::Value jParams(Json::arrayValue);
	for (std::map<Eufy::Param::value, Json::Value>::const_iterator it = params.begin(); it != params.end(); ++it)
	{
		Json::Value jParam;
		jParam["param_type"] = (int)it->first;
		jParam["param_value"] = eufyParams::dump(it->first, it->second);
		jParams.append(jParam);
	}
	m_api.updateDeviceParams(*this, jParams);
}


bool eufyDevice::isMotionDetectionEnabled() const
{
	Json::Value jValue = getParams().get(Eufy::Param::DETECT_SWITCH);
	return !jValue.isNull() && jValue.asBool();
}


void eufyDevice::startDetection()
{
	requireCamera("motion detection");
	updateParam(Eufy::Param::DETECT_SWITCH, Json::Value(true));
}


void eufyDevice::stopDetection()
{
	requireCamera("motion detection");
	updateParam(Eufy::Param::DETECT_SWITCH, Json::Value(false));
}


std::string eufyDevice::startStream()
{
	requireCamera("streaming");
	return m_api.startStream(*this);
}


void eufyDevice::stopStream()
{
	requireCamera("streaming");
	m_api.stopStream(*this);
}


void eufyDevice::enableOsd(const bool enable, eufySession *session)
{
	int value;
	switch (m_type)
	{
		case Eufy::Device::DOORBELL:
			value = enable ? 1 : 0;
			break;
		case Eufy::Device::FLOODLIGHT:
			// 0 - no timestamp, 1 - timestamp without logo, 2 - all OSD items
			value = enable ? 2 : 1;
			break;
		default:
			throw Eufy::UnsupportedError(getName() + " does not support OSD control");
	}

	eufyScopedSession scoped = acquireSession(session);
	if (!scoped->sendCommandWithIntString(0, EUFY_CMD_SET_DEVS_OSD, value))
		throw Eufy::ConnectionError("Could not send OSD command to " + getName());
}


void eufyDevice::enableManualLight(const bool enable, eufySession *session)
{
	if (m_type != Eufy::Device::FLOODLIGHT)
		throw Eufy::UnsupportedError(getName() + " has no floodlight");

	eufyScopedSession scoped = acquireSession(session);
	if (!scoped->sendCommandWithIntString(0, EUFY_CMD_SET_FLOODLIGHT_MANUAL_SWITCH, enable ? 1 : 0))
		throw Eufy::ConnectionError("Could not send floodlight command to " + getName());
}


eufyScopedSession eufyDevice::acquireSession(eufySession *session)
{
	if (session && session->validFor(getStationSerial()))
		return eufyScopedSession(session);

	eufyStation *station = m_api.getStation(getStationSerial());
	if (!station)
		throw Eufy::LookupError("Could not find station for " + getName());
	return station->connect();
}


/* private */ void eufyDevice::requireCamera(const char *operation) const
{
	if (!isCamera())
		throw Eufy::UnsupportedError(getName() + " does not support " + operation);
}
