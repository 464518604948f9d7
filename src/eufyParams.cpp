/*
 *	Client interface for Eufy Security device access
 *
 *	Device parameter catalog
 *
 *
 *	Copyright 2026 - eufypp contributors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+
 */

#include "eufyParams.hpp"
#include "eufyErrors.hpp"
#include "crypt/base64.hpp"
#include <memory>


namespace Eufy {
  namespace Param {
    struct entry {
      value param;
      const char *name;
      format fmt;
    };

    static const entry catalog[] = {
      { CHIME_STATE, "CHIME_STATE", JSON },
      { DETECT_EXPOSURE, "DETECT_EXPOSURE", JSON },
      { DETECT_MODE, "DETECT_MODE", JSON },
      { DETECT_MOTION_SENSITIVE, "DETECT_MOTION_SENSITIVE", JSON },
      { DETECT_SCENARIO, "DETECT_SCENARIO", JSON },
      { DETECT_SWITCH, "DETECT_SWITCH", BOOL },
      { DETECT_ZONE, "DETECT_ZONE", JSON },
      { DOORBELL_AUDIO_RECODE, "DOORBELL_AUDIO_RECODE", JSON },
      { DOORBELL_BRIGHTNESS, "DOORBELL_BRIGHTNESS", JSON },
      { DOORBELL_DISTORTION, "DOORBELL_DISTORTION", JSON },
      { DOORBELL_HDR, "DOORBELL_HDR", JSON },
      { DOORBELL_IR_MODE, "DOORBELL_IR_MODE", JSON },
      { DOORBELL_LED_NIGHT_MODE, "DOORBELL_LED_NIGHT_MODE", JSON },
      { DOORBELL_MOTION_ADVANCE_OPTION, "DOORBELL_MOTION_ADVANCE_OPTION", JSON },
      { DOORBELL_MOTION_NOTIFICATION, "DOORBELL_MOTION_NOTIFICATION", JSON },
      { DOORBELL_NOTIFICATION_JUMP_MODE, "DOORBELL_NOTIFICATION_JUMP_MODE", JSON },
      { DOORBELL_NOTIFICATION_OPEN, "DOORBELL_NOTIFICATION_OPEN", JSON },
      { DOORBELL_RECORD_QUALITY, "DOORBELL_RECORD_QUALITY", JSON },
      { DOORBELL_RING_RECORD, "DOORBELL_RING_RECORD", JSON },
      { DOORBELL_SNOOZE_START_TIME, "DOORBELL_SNOOZE_START_TIME", JSON },
      { DOORBELL_VIDEO_QUALITY, "DOORBELL_VIDEO_QUALITY", JSON },
      { NIGHT_VISUAL, "NIGHT_VISUAL", JSON },
      { OPEN_DEVICE, "OPEN_DEVICE", BOOL },
      { RINGING_VOLUME, "RINGING_VOLUME", JSON },
      { SDCARD, "SDCARD", JSON },
      { UN_DETECT_ZONE, "UN_DETECT_ZONE", JSON },
      { VOLUME, "VOLUME", JSON },
      { SNOOZE_MODE, "SNOOZE_MODE", BASE64_JSON },
      { WATERMARK_MODE, "WATERMARK_MODE", JSON },
      { DEVICE_UPGRADE_NOW, "DEVICE_UPGRADE_NOW", JSON },
      { CAMERA_UPGRADE_NOW, "CAMERA_UPGRADE_NOW", JSON },
      { SCHEDULE_MODE, "SCHEDULE_MODE", JSON },
      { GUARD_MODE, "GUARD_MODE", JSON },
      { DEVICE_STATUS, "DEVICE_STATUS", JSON },
      { BATTERY, "BATTERY", JSON },
      { CHARGING_STATUS, "CHARGING_STATUS", JSON },
      { SENSOR_OPEN, "SENSOR_OPEN", BOOL },
      { FLOODLIGHT_MANUAL_SWITCH, "FLOODLIGHT_MANUAL_SWITCH", BOOL },
      { FLOODLIGHT_MANUAL_BRIGHTNESS, "FLOODLIGHT_MANUAL_BRIGHTNESS", JSON },
      { FLOODLIGHT_MOTION_BRIGHTNESS, "FLOODLIGHT_MOTION_BRIGHTNESS", JSON },
      { FLOODLIGHT_SCHEDULE_BRIGHTNESS, "FLOODLIGHT_SCHEDULE_BRIGHTNESS", JSON },
      { FLOODLIGHT_MOTION_SENSITIVTY, "FLOODLIGHT_MOTION_SENSITIVTY", JSON },
      { CAMERA_SPEAKER_VOLUME, "CAMERA_SPEAKER_VOLUME", JSON },
      { CAMERA_RECORD_ENABLE_AUDIO, "CAMERA_RECORD_ENABLE_AUDIO", BOOL },
      { CAMERA_RECORD_RETRIGGER_INTERVAL, "CAMERA_RECORD_RETRIGGER_INTERVAL", JSON },
      { CAMERA_RECORD_CLIP_LENGTH, "CAMERA_RECORD_CLIP_LENGTH", JSON },
      { CAMERA_IR_CUT, "CAMERA_IR_CUT", JSON },
      { CAMERA_PIR, "CAMERA_PIR", BOOL },
      { CAMERA_WIFI_RSSI, "CAMERA_WIFI_RSSI", JSON },
      { CAMERA_MOTION_ZONES, "CAMERA_MOTION_ZONES", BASE64_JSON },
      { CAMERA_OFF, "CAMERA_OFF", BOOL },
      { IS_HOMEKIT_SECURE_VIDEO, "IS_HOMEKIT_SECURE_VIDEO", BOOL },
      { CAMERA_NOTIFICATION_OPTIONS, "CAMERA_NOTIFICATION_OPTIONS", JSON },
      { RTSP_AUTHENTICATION, "RTSP_AUTHENTICATION", STRING },
      { DEVICE_LIST_1, "DEVICE_LIST_1", JSON },
      { DEVICE_LIST_2, "DEVICE_LIST_2", JSON },
      { SENSOR_OPEN_STATUS_ALERT, "SENSOR_OPEN_STATUS_ALERT", BASE64_JSON },
      { SENSOR_DAILY_STATUS_CHECK, "SENSOR_DAILY_STATUS_CHECK", BASE64_JSON },
      { PUSH_MSG_MODE, "PUSH_MSG_MODE", JSON }
    };

    static const entry *find(const int code)
    {
      for (size_t i = 0; i < sizeof(catalog) / sizeof(catalog[0]); i++)
      {
        if (catalog[i].param == code)
          return &catalog[i];
      }
      return nullptr;
    }
  }; // namespace Param
}; // namespace Eufy


/* local */ static Json::Value parse_json(const std::string &szContent, const char *name)
{
	Json::Value jValue;
	Json::CharReaderBuilder jBuilder;
	std::unique_ptr<Json::CharReader> jReader(jBuilder.newCharReader());
	std::string szErrors;
	if (!jReader->parse(szContent.c_str(), szContent.c_str() + szContent.size(), &jValue, &szErrors))
		throw Eufy::ParamError(std::string(name) + ": invalid JSON value '" + szContent + "'");
	return jValue;
}


/* local */ static std::string write_json(const Json::Value &jValue)
{
	Json::StreamWriterBuilder jBuilder;
	jBuilder["indentation"] = "";
	return Json::writeString(jBuilder, jValue);
}


eufyParams::eufyParams(const Json::Value &jParams)
{
	if (!jParams.isArray())
		return;

	for (int i = 0; i < (int)jParams.size(); i++)
	{
		const Json::Value &jParam = jParams[i];
		if (!jParam.isObject() || !jParam["param_type"].isIntegral())
			continue;
		const Json::Value &jRaw = jParam["param_value"];
		m_raw[jParam["param_type"].asInt()] = jRaw.isString() ? jRaw.asString() : write_json(jRaw);
	}
}


bool eufyParams::lookup(const int code, Eufy::Param::value &param)
{
	const Eufy::Param::entry *entry = Eufy::Param::find(code);
	if (!entry)
		return false;
	param = entry->param;
	return true;
}


bool eufyParams::lookup(const std::string &name, Eufy::Param::value &param)
{
	for (size_t i = 0; i < sizeof(Eufy::Param::catalog) / sizeof(Eufy::Param::catalog[0]); i++)
	{
		if (name == Eufy::Param::catalog[i].name)
		{
			param = Eufy::Param::catalog[i].param;
			return true;
		}
	}
	return false;
}


const char *eufyParams::getName(const Eufy::Param::value param)
{
	const Eufy::Param::entry *entry = Eufy::Param::find(param);
	return entry ? entry->name : "UNKNOWN";
}


Eufy::Param::format eufyParams::getFormat(const Eufy::Param::value param)
{
	const Eufy::Param::entry *entry = Eufy::Param::find(param);
	return entry ? entry->fmt : Eufy::Param::JSON;
}


Json::Value eufyParams::load(const Eufy::Param::value param, const std::string &raw)
{
	if (raw.empty())
		return Json::Value();

	switch (getFormat(param))
	{
		case Eufy::Param::BOOL:
			if (raw == "0")
				return Json::Value(false);
			if (raw == "1")
				return Json::Value(true);
			throw Eufy::ParamError(std::string(getName(param)) + ": expected 0 or 1, got '" + raw + "'");
		case Eufy::Param::BASE64_JSON:
		{
			std::string szDecoded;
			if (!Eufy::base64_decode(raw, szDecoded))
				throw Eufy::ParamError(std::string(getName(param)) + ": invalid base64 value");
			return parse_json(szDecoded, getName(param));
		}
		case Eufy::Param::STRING:
			return Json::Value(raw);
		case Eufy::Param::JSON:
		default:
			break;
	}
	return parse_json(raw, getName(param));
}


std::string eufyParams::dump(const Eufy::Param::value param, const Json::Value &value)
{
	switch (getFormat(param))
	{
		case Eufy::Param::BOOL:
			if (!value.isBool() && !value.isIntegral())
				throw Eufy::ParamError(std::string(getName(param)) + ": expected a boolean");
			return value.asBool() ? "1" : "0";
		case Eufy::Param::BASE64_JSON:
			return Eufy::base64_encode(write_json(value));
		case Eufy::Param::STRING:
			if (!value.isString())
				throw Eufy::ParamError(std::string(getName(param)) + ": expected a string");
			return value.asString();
		case Eufy::Param::JSON:
		default:
			break;
	}
	return write_json(value);
}


bool eufyParams::has(const Eufy::Param::value param) const
{
	return m_raw.find(param) != m_raw.end();
}


Json::Value eufyParams::get(const Eufy::Param::value param) const
{
	std::map<int, std::string>::const_iterator it = m_raw.find(param);
	if (it == m_raw.end())
		return Json::Value();
	return load(param, it->second);
}


bool eufyParams::getRaw(const int code, std::string &raw) const
{
	std::map<int, std::string>::const_iterator it = m_raw.find(code);
	if (it == m_raw.end())
		return false;
	raw = it->second;
	return true;
}
